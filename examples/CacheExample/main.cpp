#include <cstdio>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <Cask/Containers/ConcurrentMap.hpp>

using namespace Cask::Containers;

namespace
{
    std::string_view EnvOr(const char* name)
    {
        const char* value = std::getenv(name);
        return value ? std::string_view {value} : std::string_view {};
    }

    Cask::UInt64 SlowSquare(Cask::UInt64 n)
    {
        std::this_thread::yield();
        return n * n;
    }
}// namespace

int main()
{
    // CASK_INITIAL_CAPACITY / CASK_LOAD_FACTOR override the defaults, e.g. "4096" and "0.5".
    const auto options = ParseOptions(EnvOr("CASK_INITIAL_CAPACITY"), EnvOr("CASK_LOAD_FACTOR"));
    if (!options)
    {
        std::println(stderr, "invalid configuration: {}", ToString(options.error().code));
        return EXIT_FAILURE;
    }

    ConcurrentMap<Cask::UInt64, Cask::UInt64> squares(*options);
    ConcurrentMap<std::string, Cask::Int64>   hits;

    constexpr int            workerCount = 4;
    constexpr Cask::UInt64   keySpace    = 2000;
    std::vector<std::thread> workers;
    for (int w = 0; w < workerCount; ++w)
    {
        workers.emplace_back([w, &squares, &hits] {
            for (Cask::UInt64 n = 0; n < keySpace; ++n)
            {
                const Cask::UInt64 key = (n * 7 + static_cast<Cask::UInt64>(w)) % keySpace;
                bool               computed = false;
                squares.ComputeIfAbsent(key, [&] {
                    computed = true;
                    return std::optional<Cask::UInt64> {SlowSquare(key)};
                });
                hits.Merge(computed ? "miss" : "hit", 1, [](const Cask::Int64& total, const Cask::Int64& one) {
                    return std::optional<Cask::Int64> {total + one};
                });
            }
        });
    }
    for (auto& worker: workers)
        worker.join();

    std::println("cached squares: {} (capacity {})", squares.Size(), squares.Capacity());
    std::println("misses: {}, hits: {}", hits.GetOrDefault("miss", 0), hits.GetOrDefault("hit", 0));
    std::println("square(1234) = {}", squares.GetOrDefault(1234, 0));

    squares.Quiesce();
    const auto d = squares.GetDiagnostics();
    std::println("resizes: {} started, {} completed, {} deferred, {} bins migrated", d.resizesStarted,
                 d.resizesCompleted, d.resizesDeferred, d.binsMigrated);
    std::println("lock contentions: {}, index builds: {}", d.lockContentions, d.indexBuilds);
    std::println("retired blocks: {}, reclaimed: {}", d.retiredBlocks, d.reclaimedBlocks);
    return 0;
}
