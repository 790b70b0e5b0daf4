/// @file ConcurrentMapCompound.cpp
/// @brief Compute, merge and conditional-update semantics of ConcurrentMap, including callback failures.

#include <Cask/Containers/ConcurrentMap.hpp>
#include <Cask/Exceptions/ReentrancyException.hpp>

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <stdexcept>
#include <string>

using Cask::Containers::ConcurrentMap;
using Cask::Exceptions::ReentrancyException;

namespace
{
    struct CallbackError : std::runtime_error
    {
        CallbackError() : std::runtime_error("callback failed") {}
    };

    struct SingleBinHash
    {
        std::size_t operator()(int) const noexcept { return 1; }
    };
}// namespace

TEST_CASE("ComputeIfAbsent inserts the supplied value once", "[Containers][ConcurrentMap][Compute]")
{
    ConcurrentMap<std::string, int> map;
    int                             calls = 0;

    auto first = map.ComputeIfAbsent("k", [&] {
        ++calls;
        return std::optional<int> {7};
    });
    CHECK(first == 7);

    auto second = map.ComputeIfAbsent("k", [&] {
        ++calls;
        return std::optional<int> {8};
    });
    CHECK(second == 7);
    CHECK(calls == 1);
    CHECK(map.Get("k") == 7);
}

TEST_CASE("ComputeIfAbsent with no value creates nothing", "[Containers][ConcurrentMap][Compute]")
{
    ConcurrentMap<int, int> map;
    auto result = map.ComputeIfAbsent(1, [] { return std::optional<int> {}; });
    CHECK_FALSE(result.has_value());
    CHECK_FALSE(map.ContainsKey(1));
    CHECK(map.Size() == 0U);
}

TEST_CASE("ComputeIfAbsent accepts suppliers returning a plain value", "[Containers][ConcurrentMap][Compute]")
{
    ConcurrentMap<int, std::string> map;
    CHECK(map.ComputeIfAbsent(3, [] { return std::string("three"); }) == "three");
    CHECK(map.Get(3) == "three");
}

TEST_CASE("ComputeIfPresent updates or removes present keys", "[Containers][ConcurrentMap][Compute]")
{
    ConcurrentMap<std::string, int> map;

    int calls = 0;
    CHECK_FALSE(map.ComputeIfPresent("missing", [&](const int& v) {
                       ++calls;
                       return std::optional<int> {v + 1};
                   })
                        .has_value());
    CHECK(calls == 0);
    CHECK_FALSE(map.ContainsKey("missing"));

    map.Put("x", 10);
    CHECK(map.ComputeIfPresent("x", [](const int& v) { return std::optional<int> {v * 2}; }) == 20);
    CHECK(map.Get("x") == 20);

    CHECK_FALSE(map.ComputeIfPresent("x", [](const int&) { return std::optional<int> {}; }).has_value());
    CHECK_FALSE(map.ContainsKey("x"));
    CHECK(map.Size() == 0U);
}

TEST_CASE("Compute always invokes the remapper", "[Containers][ConcurrentMap][Compute]")
{
    ConcurrentMap<std::string, int> map;

    bool sawAbsent = false;
    auto created   = map.Compute("k", [&](const std::optional<int>& current) {
        sawAbsent = !current.has_value();
        return std::optional<int> {1};
    });
    CHECK(sawAbsent);
    CHECK(created == 1);

    auto bumped = map.Compute("k", [](const std::optional<int>& current) {
        return std::optional<int> {current.value_or(0) + 1};
    });
    CHECK(bumped == 2);

    auto removed = map.Compute("k", [](const std::optional<int>&) { return std::optional<int> {}; });
    CHECK_FALSE(removed.has_value());
    CHECK_FALSE(map.ContainsKey("k"));

    auto skipped = map.Compute("never", [](const std::optional<int>&) { return std::optional<int> {}; });
    CHECK_FALSE(skipped.has_value());
    CHECK_FALSE(map.ContainsKey("never"));
    CHECK(map.Size() == 0U);
}

TEST_CASE("Merge inserts directly when absent", "[Containers][ConcurrentMap][Merge]")
{
    ConcurrentMap<std::string, int> map;
    int                             calls = 0;
    auto                            sum   = [&](const int& oldValue, const int& newValue) {
        ++calls;
        return std::optional<int> {oldValue + newValue};
    };

    CHECK(map.Merge("n", 5, sum) == 5);
    CHECK(calls == 0);
    CHECK(map.Merge("n", 3, sum) == 8);
    CHECK(calls == 1);
    CHECK(map.Get("n") == 8);
}

TEST_CASE("Merge sees the old and the new value", "[Containers][ConcurrentMap][Merge]")
{
    ConcurrentMap<int, std::string> map;
    map.Put(1, "old");
    auto merged = map.Merge(1, std::string("new"), [](const std::string& oldValue, const std::string& newValue) {
        return std::optional<std::string> {oldValue + "+" + newValue};
    });
    CHECK(merged == "old+new");
}

TEST_CASE("Merge with no value removes the entry", "[Containers][ConcurrentMap][Merge]")
{
    ConcurrentMap<int, int> map;
    map.Put(1, 1);
    auto merged = map.Merge(1, 2, [](const int&, const int&) { return std::optional<int> {}; });
    CHECK_FALSE(merged.has_value());
    CHECK_FALSE(map.ContainsKey(1));
}

TEST_CASE("ReplaceIfEquals swaps only on a matching value", "[Containers][ConcurrentMap][Replace]")
{
    ConcurrentMap<std::string, int> map;
    CHECK_FALSE(map.ReplaceIfEquals("k", 1, 2));
    CHECK_FALSE(map.ContainsKey("k"));

    map.Put("k", 1);
    CHECK_FALSE(map.ReplaceIfEquals("k", 5, 2));
    CHECK(map.Get("k") == 1);
    CHECK(map.ReplaceIfEquals("k", 1, 2));
    CHECK(map.Get("k") == 2);
}

TEST_CASE("ReplaceIfPresent never creates entries", "[Containers][ConcurrentMap][Replace]")
{
    ConcurrentMap<int, int> map;
    CHECK_FALSE(map.ReplaceIfPresent(1, 10).has_value());
    CHECK_FALSE(map.ContainsKey(1));

    map.Put(1, 10);
    CHECK(map.ReplaceIfPresent(1, 11) == 10);
    CHECK(map.Get(1) == 11);
}

TEST_CASE("RemoveIfEquals removes only a matching value", "[Containers][ConcurrentMap][Replace]")
{
    ConcurrentMap<int, std::string> map;
    CHECK_FALSE(map.RemoveIfEquals(1, "a"));

    map.Put(1, "a");
    CHECK_FALSE(map.RemoveIfEquals(1, "b"));
    CHECK(map.ContainsKey(1));
    CHECK(map.RemoveIfEquals(1, "a"));
    CHECK_FALSE(map.ContainsKey(1));
    CHECK(map.Size() == 0U);
}

TEST_CASE("Callback failures leave the map unchanged", "[Containers][ConcurrentMap][Failure]")
{
    ConcurrentMap<std::string, int> map;
    map.Put("present", 1);

    SECTION("ComputeIfAbsent")
    {
        CHECK_THROWS_AS(map.ComputeIfAbsent("absent", []() -> std::optional<int> { throw CallbackError(); }),
                        CallbackError);
        CHECK_FALSE(map.ContainsKey("absent"));
    }
    SECTION("ComputeIfPresent")
    {
        CHECK_THROWS_AS(map.ComputeIfPresent("present", [](const int&) -> std::optional<int> { throw CallbackError(); }),
                        CallbackError);
    }
    SECTION("Compute")
    {
        CHECK_THROWS_AS(map.Compute("present", [](const std::optional<int>&) -> std::optional<int> { throw CallbackError(); }),
                        CallbackError);
        CHECK_THROWS_AS(map.Compute("absent", [](const std::optional<int>&) -> std::optional<int> { throw CallbackError(); }),
                        CallbackError);
        CHECK_FALSE(map.ContainsKey("absent"));
    }
    SECTION("Merge")
    {
        CHECK_THROWS_AS(map.Merge("present", 5, [](const int&, const int&) -> std::optional<int> { throw CallbackError(); }),
                        CallbackError);
    }

    CHECK(map.Get("present") == 1);
    CHECK(map.Size() == 1U);

    // The bin lock was released on the way out.
    map.Put("present", 2);
    CHECK(map.Get("present") == 2);
}

TEST_CASE("Callbacks re-entering the same key are rejected", "[Containers][ConcurrentMap][Reentrancy]")
{
    ConcurrentMap<int, int> map;
    map.Put(1, 1);

    CHECK_THROWS_AS(map.ComputeIfPresent(1, [&](const int& v) {
        map.Put(1, v + 100);
        return std::optional<int> {v};
    }),
                    ReentrancyException);
    CHECK(map.Get(1) == 1);
    CHECK(map.GetDiagnostics().reentrancyRejections >= 1U);

    CHECK_THROWS_AS(map.ComputeIfAbsent(2, [&] { return map.ComputeIfAbsent(2, [] { return std::optional<int> {3}; }); }),
                    ReentrancyException);
    CHECK_FALSE(map.ContainsKey(2));
}

TEST_CASE("Callbacks re-entering a colliding key are rejected", "[Containers][ConcurrentMap][Reentrancy]")
{
    ConcurrentMap<int, int, SingleBinHash> map;
    CHECK_THROWS_AS(map.Compute(1, [&](const std::optional<int>&) {
        map.Put(2, 2);
        return std::optional<int> {1};
    }),
                    ReentrancyException);
    CHECK(map.Size() == 0U);
}

TEST_CASE("Callbacks may read the map and write other bins", "[Containers][ConcurrentMap][Reentrancy]")
{
    ConcurrentMap<int, int> map;
    map.Put(1, 10);
    map.Put(2, 20);

    auto result = map.Compute(1, [&](const std::optional<int>& current) {
        // Reads never lock, so the held bin is still readable.
        const int self  = map.GetOrDefault(1, -1);
        const int other = map.GetOrDefault(2, -1);
        return std::optional<int> {current.value_or(0) + self + other};
    });
    CHECK(result == 40);

    // Most of keys 100..163 land outside key 5's bin.
    int written = 0;
    map.ComputeIfAbsent(5, [&] {
        for (int k = 100; k < 164; ++k)
        {
            try
            {
                map.Put(k, k);
                ++written;
            } catch (const ReentrancyException&)
            {
            }
        }
        return std::optional<int> {5};
    });
    CHECK(written > 0);
    CHECK(map.Get(5) == 5);
}

TEST_CASE("Reserve and Quiesce are rejected inside callbacks", "[Containers][ConcurrentMap][Reentrancy]")
{
    ConcurrentMap<int, int> map;
    CHECK_THROWS_AS(map.ComputeIfAbsent(1, [&] {
        map.Reserve(1000);
        return std::optional<int> {1};
    }),
                    ReentrancyException);
    CHECK_THROWS_AS(map.ComputeIfAbsent(1, [&] {
        map.Quiesce();
        return std::optional<int> {1};
    }),
                    ReentrancyException);
    CHECK_FALSE(map.ContainsKey(1));
}

TEST_CASE("Inserts from inside callbacks defer resizing", "[Containers][ConcurrentMap][Reentrancy]")
{
    ConcurrentMap<int, int> map(2);
    const auto              before         = map.Capacity();
    std::size_t             duringCallback = 0;

    map.ComputeIfAbsent(-1, [&] {
        for (int k = 0; k < 200; ++k)
        {
            try
            {
                map.Put(k, k);
            } catch (const ReentrancyException&)
            {
            }
        }
        duringCallback = map.Capacity();
        return std::optional<int> {0};
    });
    CHECK(duringCallback == before);

    // The outer operation releases its bin before noticing the overload.
    CHECK(map.Capacity() > before);
    for (int k = 0; k < 200; ++k)
    {
        if (map.ContainsKey(k))
            CHECK(map.Get(k) == k);
    }
}
