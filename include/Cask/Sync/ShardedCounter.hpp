/// @file ShardedCounter.hpp
/// @brief Contention-spreading signed counter with an approximate, lock-free total.
#pragma once

#include <atomic>
#include <functional>
#include <thread>

#include <Cask/Primitives.hpp>

namespace Cask::Sync
{
    /// @brief Counter whose updates land in per-thread shards and are periodically folded into a base value.
    ///
    /// @details
    /// Load() sums the base and every shard without locking, so it reflects some interleaving of the
    /// concurrent updates rather than a point-in-time value. When updates stop it is exact.
    class ShardedCounter
    {
    public:
        static constexpr UIntSize kShardCount            = 64;// power of two
        static constexpr UIntSize kDefaultFlushThreshold = 32;

        ShardedCounter() noexcept = default;

        ShardedCounter(const ShardedCounter&)            = delete;
        ShardedCounter& operator=(const ShardedCounter&) = delete;

        void Add(Int64 delta) noexcept
        {
            if (delta == 0)
                return;
            const UIntSize shardIndex = ShardIndex();
            auto&          shard      = m_shards[shardIndex];
            const Int64    newDelta   = shard.delta.fetch_add(delta, std::memory_order_relaxed) + delta;
            const auto     limit      = static_cast<Int64>(m_flushThreshold.load(std::memory_order_relaxed));
            if (newDelta >= limit || newDelta <= -limit)
                FlushShard(shardIndex);
        }

        void Increment() noexcept { Add(1); }
        void Decrement() noexcept { Add(-1); }

        /// @brief Sum of the base and all shards, clamped at zero.
        [[nodiscard]] UIntSize Load() const noexcept
        {
            // Signed accumulation: a shard may hold a negative delta larger than the committed base.
            Int64 total = m_base.load(std::memory_order_acquire);
            for (const auto& shard: m_shards)
                total += shard.delta.load(std::memory_order_acquire);
            return total < 0 ? 0 : static_cast<UIntSize>(total);
        }

        void FlushAll() noexcept
        {
            for (UIntSize i = 0; i < kShardCount; ++i)
                FlushShard(i);
        }

        /// @pre No concurrent Add.
        void Reset() noexcept
        {
            m_base.store(0, std::memory_order_relaxed);
            for (auto& shard: m_shards)
                shard.delta.store(0, std::memory_order_relaxed);
        }

        void SetFlushThreshold(UIntSize threshold) noexcept
        {
            if (threshold == 0)
                threshold = 1;// zero would flush on every update
            m_flushThreshold.store(threshold, std::memory_order_release);
        }

    private:
        struct alignas(64) Shard
        {
            std::atomic<Int64> delta {0};
        };

        [[nodiscard]] static UIntSize ShardIndex() noexcept
        {
            static thread_local UIntSize shardIndex = kShardCount;// sentinel
            if (shardIndex >= kShardCount)
            {
                const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
                shardIndex     = static_cast<UIntSize>(tid) & (kShardCount - 1);
            }
            return shardIndex;
        }

        void FlushShard(UIntSize shardIndex) noexcept
        {
            const Int64 delta = m_shards[shardIndex].delta.exchange(0, std::memory_order_acq_rel);
            if (delta != 0)
                m_base.fetch_add(delta, std::memory_order_acq_rel);
        }

        std::atomic<Int64>    m_base {0};
        std::atomic<UIntSize> m_flushThreshold {kDefaultFlushThreshold};
        Shard                 m_shards[kShardCount] {};
    };
}// namespace Cask::Sync
