/// @file EpochReclaimer.hpp
/// @brief Epoch-based deferred reclamation for lock-free readers, scoped to a single owner.
///
/// Strategy:
///  - A global epoch advances only once every pinned guard has announced the current epoch.
///  - Guards announce the epoch they entered in one of a fixed set of cache-line slots; 0 means
///    the slot is free. When every slot is taken a guard falls back to an overflow count that
///    blocks advancement outright.
///  - Retired objects are tagged with the epoch current at retirement and freed once the global
///    epoch is two ahead of it, at which point no guard can still reference them.
///  - Collection is triggered by guards leaving after enough retirements and may run on several
///    threads at once: each collector detaches the shared list, frees what has expired and puts
///    the rest back.

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>

#include <Cask/Primitives.hpp>

namespace Cask::Memory
{
    /// @brief Intrusive hook embedded in every object handed to EpochReclaimer::Retire.
    struct Retirable
    {
        Retirable* nextRetired {nullptr};
        UInt64     retireEpoch {0};
        UInt8      retiredKind {0};// owner-defined tag telling the reclaim function what this is
    };

    class EpochReclaimer
    {
    public:
        using ReclaimFn = void (*)(void* context, Retirable* object) noexcept;

        static constexpr UIntSize kSlotCount       = 64;// power of two
        static constexpr UInt64   kCollectInterval = 64;

        class Guard
        {
        public:
            Guard(const Guard&)            = delete;
            Guard& operator=(const Guard&) = delete;

            Guard(Guard&& other) noexcept : m_owner(other.m_owner), m_slot(other.m_slot) { other.m_owner = nullptr; }
            Guard& operator=(Guard&&) = delete;

            ~Guard()
            {
                if (m_owner)
                    m_owner->Leave(m_slot);
            }

        private:
            friend class EpochReclaimer;

            Guard(EpochReclaimer& owner, UIntSize slot) noexcept : m_owner(&owner), m_slot(slot) {}

            EpochReclaimer* m_owner;
            UIntSize        m_slot;
        };

        EpochReclaimer(ReclaimFn reclaim, void* context) noexcept
            : m_reclaim(reclaim), m_context(context)
        {
        }

        EpochReclaimer(const EpochReclaimer&)            = delete;
        EpochReclaimer& operator=(const EpochReclaimer&) = delete;

        /// @pre No Guard is alive.
        ~EpochReclaimer()
        {
            Drain();
        }

        /// @brief Announces the calling thread as a reader until the returned Guard is destroyed.
        [[nodiscard]] Guard Pin() noexcept
        {
            const UIntSize start = SlotHint();
            for (UIntSize i = 0; i < kSlotCount; ++i)
            {
                const UIntSize slot   = (start + i) & (kSlotCount - 1);
                auto&          epoch  = m_slots[slot].epoch;
                UInt64         vacant = 0;
                if (epoch.load(std::memory_order_relaxed) == 0 &&
                    epoch.compare_exchange_strong(vacant, m_epoch.load(std::memory_order_relaxed),
                                                  std::memory_order_seq_cst, std::memory_order_relaxed))
                {
                    std::atomic_thread_fence(std::memory_order_seq_cst);
                    return Guard(*this, slot);
                }
            }
            m_overflow.fetch_add(1, std::memory_order_seq_cst);
            std::atomic_thread_fence(std::memory_order_seq_cst);
            return Guard(*this, kOverflowSlot);
        }

        /// @brief Queues @p object for reclamation once no guard can still reach it.
        /// @pre @p object is no longer reachable by an operation that starts after this call.
        void Retire(Retirable* object) noexcept
        {
            if (!object)
                return;
            std::atomic_thread_fence(std::memory_order_seq_cst);
            object->retireEpoch = m_epoch.load(std::memory_order_relaxed);
            Push(object, object);
            m_retiredCount.fetch_add(1, std::memory_order_relaxed);
            m_sinceCollect.fetch_add(1, std::memory_order_relaxed);
        }

        /// @brief Advances the epoch as far as current guards allow and frees what has expired.
        /// @return false while some retired objects are still reachable by a live guard.
        bool TryReclaim() noexcept
        {
            return Collect();
        }

        /// @brief Frees everything retired so far.
        /// @pre No Guard is alive and no thread is retiring concurrently.
        void Drain() noexcept
        {
            Retirable* batch = m_retired.exchange(nullptr, std::memory_order_acq_rel);
            while (batch)
            {
                Retirable* next = batch->nextRetired;
                Free(batch);
                batch = next;
            }
        }

        [[nodiscard]] UIntSize ActiveGuards() const noexcept
        {
            UIntSize active = m_overflow.load(std::memory_order_acquire);
            for (const auto& slot: m_slots)
            {
                if (slot.epoch.load(std::memory_order_acquire) != 0)
                    ++active;
            }
            return active;
        }

        [[nodiscard]] UInt64 Epoch() const noexcept
        {
            return m_epoch.load(std::memory_order_acquire);
        }

        [[nodiscard]] UInt64 RetiredCount() const noexcept
        {
            return m_retiredCount.load(std::memory_order_relaxed);
        }

        [[nodiscard]] UInt64 ReclaimedCount() const noexcept
        {
            return m_reclaimedCount.load(std::memory_order_relaxed);
        }

        [[nodiscard]] UInt64 PendingCount() const noexcept
        {
            return RetiredCount() - ReclaimedCount();
        }

    private:
        static constexpr UIntSize kOverflowSlot = kSlotCount;

        struct alignas(64) Slot
        {
            std::atomic<UInt64> epoch {0};
        };

        [[nodiscard]] static UIntSize SlotHint() noexcept
        {
            static thread_local UIntSize hint = kSlotCount;// sentinel
            if (hint >= kSlotCount)
            {
                const auto tid = std::hash<std::thread::id>()(std::this_thread::get_id());
                hint           = static_cast<UIntSize>(tid) & (kSlotCount - 1);
            }
            return hint;
        }

        void Leave(UIntSize slot) noexcept
        {
            if (slot == kOverflowSlot)
                m_overflow.fetch_sub(1, std::memory_order_release);
            else
                m_slots[slot].epoch.store(0, std::memory_order_release);

            if (m_sinceCollect.load(std::memory_order_relaxed) >= kCollectInterval &&
                m_sinceCollect.exchange(0, std::memory_order_relaxed) >= kCollectInterval)
            {
                Collect();
            }
        }

        /// Moves the global epoch forward by one if every pinned guard has seen the current one.
        bool TryAdvance() noexcept
        {
            const UInt64 current = m_epoch.load(std::memory_order_relaxed);
            std::atomic_thread_fence(std::memory_order_seq_cst);
            if (m_overflow.load(std::memory_order_relaxed) != 0)
                return false;
            for (const auto& slot: m_slots)
            {
                const UInt64 announced = slot.epoch.load(std::memory_order_relaxed);
                if (announced != 0 && announced != current)
                    return false;
            }
            std::atomic_thread_fence(std::memory_order_acquire);
            UInt64 expected = current;
            m_epoch.compare_exchange_strong(expected, current + 1, std::memory_order_release, std::memory_order_relaxed);
            return true;
        }

        bool Collect() noexcept
        {
            Retirable* batch = m_retired.exchange(nullptr, std::memory_order_acquire);
            if (!batch)
                return true;

            for (int step = 0; step < 2 && TryAdvance(); ++step)
            {
            }
            const UInt64 epoch = m_epoch.load(std::memory_order_acquire);

            Retirable* keepHead = nullptr;
            Retirable* keepTail = nullptr;
            while (batch)
            {
                Retirable* next = batch->nextRetired;
                if (epoch - batch->retireEpoch >= 2)
                {
                    Free(batch);
                }
                else
                {
                    batch->nextRetired = keepHead;
                    keepHead           = batch;
                    if (!keepTail)
                        keepTail = batch;
                }
                batch = next;
            }
            if (!keepHead)
                return true;
            Push(keepHead, keepTail);
            return false;
        }

        void Push(Retirable* first, Retirable* last) noexcept
        {
            Retirable* head = m_retired.load(std::memory_order_relaxed);
            do
            {
                last->nextRetired = head;
            } while (!m_retired.compare_exchange_weak(head, first, std::memory_order_release, std::memory_order_relaxed));
        }

        void Free(Retirable* object) noexcept
        {
            m_reclaim(m_context, object);
            m_reclaimedCount.fetch_add(1, std::memory_order_relaxed);
        }

        ReclaimFn               m_reclaim;
        void*                   m_context;
        std::atomic<UInt64>     m_epoch {1};
        std::atomic<UIntSize>   m_overflow {0};
        std::atomic<Retirable*> m_retired {nullptr};
        std::atomic<UInt64>     m_retiredCount {0};
        std::atomic<UInt64>     m_reclaimedCount {0};
        std::atomic<UInt64>     m_sinceCollect {0};
        Slot                    m_slots[kSlotCount] {};
    };
}// namespace Cask::Memory
