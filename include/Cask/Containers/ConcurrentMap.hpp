/// @file ConcurrentMap.hpp
/// @brief Concurrent hash map with per-bin locking, lock-free reads and cooperative resizing.
///
/// Every operation is atomic with respect to its target key only. Mutations lock the single bin
/// the key hashes to; reads never lock. Supplier, remapper and combiner callbacks run while the
/// target bin is locked: a callback that calls back into the same bin throws
/// Exceptions::ReentrancyException instead of deadlocking. Callbacks that block on other threads
/// which in turn wait on this bin are not detected and deadlock.

#pragma once

#include <Cask/Containers/BucketLockRegistry.hpp>
#include <Cask/Containers/Config.hpp>
#include <Cask/Containers/ConcurrentMapOptions.hpp>
#include <Cask/Defines.hpp>
#include <Cask/Exceptions/InvalidConfigurationException.hpp>
#include <Cask/Exceptions/ReentrancyException.hpp>
#include <Cask/Memory/AllocationHelpers.hpp>
#include <Cask/Memory/AllocatorConcept.hpp>
#include <Cask/Memory/EpochReclaimer.hpp>
#include <Cask/Memory/SystemAllocator.hpp>
#include <Cask/Primitives.hpp>
#include <Cask/Sync/LockGuard.hpp>
#include <Cask/Sync/ShardedCounter.hpp>
#include <Cask/Sync/SpinLock.hpp>

#include <algorithm>
#include <atomic>
#include <bit>
#include <cstddef>
#include <functional>
#include <limits>
#include <new>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Cask::Containers
{
    /// @brief Point-in-time copy of a map's internal counters. All fields are monotonic until reset.
    struct ConcurrentMapDiagnostics
    {
        UInt64 resizesStarted {0};
        UInt64 resizesCompleted {0};
        UInt64 resizeAllocationFailures {0};
        UInt64 resizesDeferred {0};
        UInt64 binsMigrated {0};
        UInt64 lockContentions {0};
        UInt64 indexBuilds {0};
        UInt64 reentrancyRejections {0};
        UInt64 retiredBlocks {0};
        UInt64 reclaimedBlocks {0};
    };

    namespace detail
    {
        /// Per-bin resize state. Transitions only forward and only under the bin lock. The chain of a
        /// Migrating or Migrated bin is frozen but stays readable until its table is reclaimed.
        enum class BinState : UInt8
        {
            NotMigrated = 0,
            Migrating,
            Migrated,
        };

        enum class RetiredKind : UInt8
        {
            Node = 1,
            Cell,
            Index,
            Table,
        };

        inline constexpr UIntSize kTreeifyThreshold    = CASK_CONCURRENT_MAP_TREEIFY_THRESHOLD;
        inline constexpr UIntSize kUntreeifyThreshold  = CASK_CONCURRENT_MAP_UNTREEIFY_THRESHOLD;
        inline constexpr UIntSize kMinIndexedCapacity  = CASK_CONCURRENT_MAP_MIN_INDEXED_CAPACITY;
        inline constexpr UIntSize kMigrationStride     = CASK_CONCURRENT_MAP_MIGRATION_STRIDE;
        inline constexpr UIntSize kUnboundedMigration  = std::numeric_limits<UIntSize>::max();

        /// Immutable value holder. Updates swap the whole cell so readers never see a torn value.
        template<class Value>
        struct ValueCell : Memory::Retirable
        {
            template<class... Args>
            explicit ValueCell(std::in_place_t, Args&&... args)
                : value(std::forward<Args>(args)...)
            {
                retiredKind = static_cast<UInt8>(RetiredKind::Cell);
            }

            Value value;
        };

        /// A node sits in one chain per live table generation. Consecutive tables thread their chains
        /// through alternating links, so migrating into a successor never disturbs the chain readers
        /// of the predecessor are walking.
        template<class Key, class Value>
        struct Node : Memory::Retirable
        {
            using Cell = ValueCell<Value>;

            Node(std::size_t h, const Key& k, Cell* c)
                : hash(h), key(k), cell(c)
            {
                retiredKind = static_cast<UInt8>(RetiredKind::Node);
            }

            const std::size_t  hash;
            const Key          key;
            std::atomic<Cell*> cell;
            std::atomic<Node*> next[2] {};
        };

        /// Hash-sorted view of a crowded bin's chain. Rebuilt copy-on-write by writers.
        template<class NodeT>
        struct BinIndex : Memory::Retirable
        {
            BinIndex() noexcept
            {
                retiredKind = static_cast<UInt8>(RetiredKind::Index);
            }

            NodeT**  entries {nullptr};
            UIntSize count {0};
            UIntSize slots {0};
        };

        template<class NodeT>
        struct Bin
        {
            std::atomic<NodeT*>           head {nullptr};
            std::atomic<BinIndex<NodeT>*> index {nullptr};
            std::atomic<UInt8>            state {static_cast<UInt8>(BinState::NotMigrated)};
            Sync::SpinLock                lock {};
            UInt32                        length {0};// guarded by lock

            [[nodiscard]] BinState State(std::memory_order order = std::memory_order_acquire) const noexcept
            {
                return static_cast<BinState>(state.load(order));
            }

            void SetState(BinState next) noexcept
            {
                state.store(static_cast<UInt8>(next), std::memory_order_release);
            }
        };

        template<class NodeT>
        struct Table : Memory::Retirable
        {
            Table() noexcept
            {
                retiredKind = static_cast<UInt8>(RetiredKind::Table);
            }

            Bin<NodeT>*           bins {nullptr};
            UIntSize              capacity {0};
            UIntSize              mask {0};
            UIntSize              threshold {0};
            UInt8                 link {0};// which of Node::next threads this table's chains
            std::atomic<Table*>   next {nullptr};// successor while a resize is in flight
            std::atomic<UIntSize> nextClaim {0};
            std::atomic<UIntSize> migratedBins {0};
        };

        struct DiagnosticCounters
        {
            std::atomic<UInt64> resizesStarted {0};
            std::atomic<UInt64> resizesCompleted {0};
            std::atomic<UInt64> resizeAllocationFailures {0};
            std::atomic<UInt64> resizesDeferred {0};
            std::atomic<UInt64> binsMigrated {0};
            std::atomic<UInt64> lockContentions {0};
            std::atomic<UInt64> indexBuilds {0};
            std::atomic<UInt64> reentrancyRejections {0};

            static void Bump(std::atomic<UInt64>& counter) noexcept
            {
                counter.fetch_add(1, std::memory_order_relaxed);
            }

            void Reset() noexcept
            {
                for (auto* counter: {&resizesStarted, &resizesCompleted, &resizeAllocationFailures, &resizesDeferred,
                                     &binsMigrated, &lockContentions, &indexBuilds, &reentrancyRejections})
                    counter->store(0, std::memory_order_relaxed);
            }
        };
    }// namespace detail

    /// @brief Thread-safe hash map with atomic per-key compound operations.
    ///
    /// @details
    /// Absent values are reported as an empty std::optional; callbacks return an empty optional to
    /// mean "no value" (remove the entry, or do not create one). Size() and ForEach() are weakly
    /// consistent. Copying a map produces a new, empty map with default options.
    template<class Key,
             class Value,
             class Hash                         = std::hash<Key>,
             class Equal                        = std::equal_to<Key>,
             Memory::AllocatorConcept Allocator = Memory::SystemAllocator>
    class ConcurrentMap
    {
        static_assert(std::is_copy_constructible_v<Key>, "ConcurrentMap stores its own copy of each key.");
        static_assert(std::is_copy_constructible_v<Value>, "ConcurrentMap hands values out by copy.");

    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = Equal;
        using allocator_type = Allocator;
        using size_type      = UIntSize;

        ConcurrentMap() : ConcurrentMap(ConcurrentMapOptions {}) {}

        /// @throws Exceptions::InvalidConfigurationException when @p options fail ValidateOptions.
        explicit ConcurrentMap(const ConcurrentMapOptions& options,
                               const Hash&                 hash      = Hash {},
                               const Equal&                equal     = Equal {},
                               const Allocator&            allocator = Allocator {})
            : m_options(Validated(options)),
              m_hash(hash),
              m_equal(equal),
              m_allocator(allocator),
              m_reclaimer(&ConcurrentMap::ReclaimThunk, this)
        {
            m_table.store(CreateTable(TableSizeFor(m_options.initialCapacity, m_options.loadFactor), 0),
                          std::memory_order_release);
        }

        explicit ConcurrentMap(size_type initialCapacity, F64 loadFactor = ConcurrentMapOptions::kDefaultLoadFactor)
            : ConcurrentMap(ConcurrentMapOptions {initialCapacity, loadFactor})
        {
        }

        /// @brief Duplicating a map yields a brand-new empty map with default options.
        ///
        /// Entries are not copied; only the hash, equality and allocator objects carry over.
        ConcurrentMap(const ConcurrentMap& other)
            : ConcurrentMap(ConcurrentMapOptions {}, other.m_hash, other.m_equal, other.m_allocator)
        {
        }

        ConcurrentMap& operator=(const ConcurrentMap&) = delete;
        ConcurrentMap(ConcurrentMap&&)                 = delete;
        ConcurrentMap& operator=(ConcurrentMap&&)      = delete;

        /// @pre No other thread is using the map.
        ~ConcurrentMap()
        {
            DestroyAll();
        }

        // ------------------------------------------------------------------
        // Reads
        // ------------------------------------------------------------------

        [[nodiscard]] std::optional<Value> Get(const Key& key) const
        {
            const std::size_t hash = ComputeHash(key);
            auto              pin  = m_reclaimer.Pin();
            if (const NodeType* node = FindNode(key, hash))
                return node->cell.load(std::memory_order_acquire)->value;
            return std::nullopt;
        }

        [[nodiscard]] Value GetOrDefault(const Key& key, Value defaultValue) const
        {
            if (auto value = Get(key))
                return std::move(*value);
            return defaultValue;
        }

        [[nodiscard]] bool ContainsKey(const Key& key) const
        {
            const std::size_t hash = ComputeHash(key);
            auto              pin  = m_reclaimer.Pin();
            return FindNode(key, hash) != nullptr;
        }

        /// @brief Approximate entry count. Exact once concurrent writers have finished.
        [[nodiscard]] size_type Size() const noexcept
        {
            return m_size.Load();
        }

        [[nodiscard]] bool Empty() const noexcept
        {
            return Size() == 0;
        }

        /// @brief Bin count of the currently published table.
        [[nodiscard]] size_type Capacity() const noexcept
        {
            auto pin = m_reclaimer.Pin();
            return m_table.load(std::memory_order_acquire)->capacity;
        }

        /// @brief Current entries-per-bin ratio.
        [[nodiscard]] F64 LoadFactor() const noexcept
        {
            return static_cast<F64>(Size()) / static_cast<F64>(Capacity());
        }

        [[nodiscard]] const ConcurrentMapOptions& Options() const noexcept
        {
            return m_options;
        }

        /// @brief Visits a weakly consistent view of the map.
        ///
        /// Bins are locked one at a time only long enough to snapshot their entries; @p visitor
        /// runs with no lock held and may call back into the map. Every entry present for the
        /// whole traversal is visited exactly once.
        template<class Visitor>
        void ForEach(Visitor&& visitor) const
        {
            auto pin = m_reclaimer.Pin();
            std::vector<std::pair<const NodeType*, const CellType*>> batch;
            ForEachLiveBin([&](const TableType& table, BinType& bin, BinLock& lock) {
                batch.clear();
                for (NodeType* node = bin.head.load(std::memory_order_relaxed); node;
                     node           = node->next[table.link].load(std::memory_order_relaxed))
                    batch.emplace_back(node, node->cell.load(std::memory_order_acquire));
                lock.Unlock();
                for (const auto& [node, cell]: batch)
                    std::invoke(visitor, node->key, cell->value);
            });
        }

        // ------------------------------------------------------------------
        // Writes
        // ------------------------------------------------------------------

        /// @brief Inserts or overwrites. @return the previous value, if any.
        std::optional<Value> Put(const Key& key, Value value)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (found.node)
                {
                    std::optional<Value> previous = CurrentValue(*found.node);
                    ReplaceCell(*found.node, MakeCell(std::move(value)));
                    return previous;
                }
                InsertLocked(table, bin, hash, key, MakeCell(std::move(value)), outcome);
                return std::nullopt;
            });
        }

        /// @brief Same as Put: stores @p value and returns what it replaced.
        std::optional<Value> GetAndSet(const Key& key, Value value)
        {
            return Put(key, std::move(value));
        }

        /// @brief Inserts or overwrites without copying out the previous value.
        void Set(const Key& key, Value value)
        {
            Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) {
                const Located found = FindLocked(table, bin, key, hash);
                if (found.node)
                    ReplaceCell(*found.node, MakeCell(std::move(value)));
                else
                    InsertLocked(table, bin, hash, key, MakeCell(std::move(value)), outcome);
                return true;
            });
        }

        /// @brief Inserts only when @p key is absent. @return the existing value when present.
        std::optional<Value> PutIfAbsent(const Key& key, Value value)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (found.node)
                    return CurrentValue(*found.node);
                InsertLocked(table, bin, hash, key, MakeCell(std::move(value)), outcome);
                return std::nullopt;
            });
        }

        /// @brief Returns the value for @p key, creating it from @p supplier when absent.
        ///
        /// @p supplier is invoked at most once, with the bin locked, and only if the key is absent
        /// at that moment. An empty result creates no entry and is returned as-is.
        template<class Supplier>
        std::optional<Value> ComputeIfAbsent(const Key& key, Supplier&& supplier)
        {
            {
                const std::size_t hash = ComputeHash(key);
                auto              pin  = m_reclaimer.Pin();
                if (const NodeType* node = FindNode(key, hash))
                    return node->cell.load(std::memory_order_acquire)->value;
            }
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (found.node)
                    return CurrentValue(*found.node);
                std::optional<Value> produced = std::invoke(supplier);
                if (!produced)
                    return std::nullopt;
                std::optional<Value> result = *produced;
                InsertLocked(table, bin, hash, key, MakeCell(std::move(*produced)), outcome);
                return result;
            });
        }

        /// @brief Replaces the value of a present key with @p remapper(current); an empty result removes it.
        template<class Remapper>
        std::optional<Value> ComputeIfPresent(const Key& key, Remapper&& remapper)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node)
                    return std::nullopt;
                const CellType*      cell     = found.node->cell.load(std::memory_order_relaxed);
                std::optional<Value> produced = std::invoke(remapper, std::as_const(cell->value));
                return Commit(table, bin, hash, key, found, std::move(produced), outcome);
            });
        }

        /// @brief Always invokes @p remapper with the current value (empty when absent).
        ///
        /// A non-empty result inserts or replaces; an empty result removes the entry or skips the insert.
        template<class Remapper>
        std::optional<Value> Compute(const Key& key, Remapper&& remapper)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located              found    = FindLocked(table, bin, key, hash);
                const std::optional<Value> current  = found.node ? CurrentValue(*found.node) : std::nullopt;
                std::optional<Value>       produced = std::invoke(remapper, current);
                return Commit(table, bin, hash, key, found, std::move(produced), outcome);
            });
        }

        /// @brief Associates @p value when absent, otherwise stores @p combiner(old, value).
        ///
        /// The combiner is not invoked for an absent key. An empty combiner result removes the entry.
        template<class Combiner>
        std::optional<Value> Merge(const Key& key, Value value, Combiner&& combiner)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node)
                {
                    std::optional<Value> result = value;
                    InsertLocked(table, bin, hash, key, MakeCell(std::move(value)), outcome);
                    return result;
                }
                const CellType*      cell     = found.node->cell.load(std::memory_order_relaxed);
                std::optional<Value> produced = std::invoke(combiner, std::as_const(cell->value), std::as_const(value));
                return Commit(table, bin, hash, key, found, std::move(produced), outcome);
            });
        }

        /// @brief Compare-and-swap: stores @p desired only if the current value equals @p expected.
        bool ReplaceIfEquals(const Key& key, const Value& expected, Value desired)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome&) {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node || !(found.node->cell.load(std::memory_order_relaxed)->value == expected))
                    return false;
                ReplaceCell(*found.node, MakeCell(std::move(desired)));
                return true;
            });
        }

        /// @brief Replaces the value only if @p key is present. @return the replaced value.
        std::optional<Value> ReplaceIfPresent(const Key& key, Value value)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome&) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node)
                    return std::nullopt;
                std::optional<Value> previous = CurrentValue(*found.node);
                ReplaceCell(*found.node, MakeCell(std::move(value)));
                return previous;
            });
        }

        /// @return the removed value, if any.
        std::optional<Value> Remove(const Key& key)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) -> std::optional<Value> {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node)
                    return std::nullopt;
                std::optional<Value> removed = CurrentValue(*found.node);
                UnlinkLocked(table, bin, found, outcome);
                return removed;
            });
        }

        /// @brief Removes @p key only if its current value equals @p expected.
        bool RemoveIfEquals(const Key& key, const Value& expected)
        {
            return Mutate(key, [&](TableType& table, BinType& bin, std::size_t hash, WriteOutcome& outcome) {
                const Located found = FindLocked(table, bin, key, hash);
                if (!found.node || !(found.node->cell.load(std::memory_order_relaxed)->value == expected))
                    return false;
                UnlinkLocked(table, bin, found, outcome);
                return true;
            });
        }

        /// @brief Removes every entry, one bin at a time. Inserts racing with Clear may survive.
        void Clear()
        {
            auto pin = m_reclaimer.Pin();
            ForEachLiveBin([&](const TableType& table, BinType& bin, BinLock&) {
                NodeType* node = bin.head.load(std::memory_order_relaxed);
                bin.head.store(nullptr, std::memory_order_release);
                if (auto* index = bin.index.exchange(nullptr, std::memory_order_acq_rel))
                    m_reclaimer.Retire(index);
                Int64 removed = 0;
                while (node)
                {
                    NodeType* next = node->next[table.link].load(std::memory_order_relaxed);
                    m_reclaimer.Retire(node->cell.load(std::memory_order_relaxed));
                    m_reclaimer.Retire(node);
                    node = next;
                    ++removed;
                }
                bin.length = 0;
                m_size.Add(-removed);
            });
        }

        // ------------------------------------------------------------------
        // Capacity management
        // ------------------------------------------------------------------

        /// @brief Grows the table so @p expectedEntries fit without a further resize.
        /// @throws Exceptions::ReentrancyException when called from a callback.
        /// @throws std::bad_alloc when the larger table cannot be allocated.
        void Reserve(size_type expectedEntries)
        {
            RejectInsideCallback();
            const UIntSize target = TableSizeFor(std::max<size_type>(expectedEntries, 1), m_options.loadFactor);
            while (true)
            {
                ResizeStart started;
                {
                    auto pin = m_reclaimer.Pin();
                    DrainResize();
                    TableType* current = m_table.load(std::memory_order_acquire);
                    if (current->capacity >= target)
                        return;
                    started = StartResize(*current, target);
                }
                if (started == ResizeStart::AllocationFailed)
                    throw std::bad_alloc();
                if (started == ResizeStart::Deferred)
                {
                    m_reclaimer.TryReclaim();
                    std::this_thread::yield();
                }
            }
        }

        /// @brief Finishes any in-flight resize and frees retired memory no running operation can reach.
        /// @throws Exceptions::ReentrancyException when called from a callback.
        void Quiesce()
        {
            RejectInsideCallback();
            {
                auto pin = m_reclaimer.Pin();
                DrainResize();
            }
            m_size.FlushAll();
            m_reclaimer.TryReclaim();
        }

        // ------------------------------------------------------------------
        // Diagnostics
        // ------------------------------------------------------------------

        [[nodiscard]] ConcurrentMapDiagnostics GetDiagnostics() const noexcept
        {
            ConcurrentMapDiagnostics snapshot;
            snapshot.resizesStarted           = m_diagnostics.resizesStarted.load(std::memory_order_relaxed);
            snapshot.resizesCompleted         = m_diagnostics.resizesCompleted.load(std::memory_order_relaxed);
            snapshot.resizeAllocationFailures = m_diagnostics.resizeAllocationFailures.load(std::memory_order_relaxed);
            snapshot.resizesDeferred          = m_diagnostics.resizesDeferred.load(std::memory_order_relaxed);
            snapshot.binsMigrated             = m_diagnostics.binsMigrated.load(std::memory_order_relaxed);
            snapshot.lockContentions          = m_diagnostics.lockContentions.load(std::memory_order_relaxed);
            snapshot.indexBuilds              = m_diagnostics.indexBuilds.load(std::memory_order_relaxed);
            snapshot.reentrancyRejections     = m_diagnostics.reentrancyRejections.load(std::memory_order_relaxed);
            snapshot.retiredBlocks            = m_reclaimer.RetiredCount();
            snapshot.reclaimedBlocks          = m_reclaimer.ReclaimedCount();
            return snapshot;
        }

        /// @brief Zeroes the resize, contention, index and re-entrancy counters.
        void ResetDiagnostics() noexcept
        {
            m_diagnostics.Reset();
        }

    private:
        using NodeType  = detail::Node<Key, Value>;
        using CellType  = detail::ValueCell<Value>;
        using BinType   = detail::Bin<NodeType>;
        using IndexType = detail::BinIndex<NodeType>;
        using TableType = detail::Table<NodeType>;

        struct WriteOutcome
        {
            bool inserted {false};
            bool crowded {false};// a bin reached the index threshold on a table too small to index
        };

        struct Located
        {
            NodeType* predecessor {nullptr};
            NodeType* node {nullptr};
        };

        enum class ResizeStart : UInt8
        {
            Started,
            Deferred,// a retired table may still be read through the links the successor would reuse
            AllocationFailed,
        };

        /// Holds a bin lock and registers it with the calling thread's BucketLockRegistry.
        class BinLock
        {
        public:
            BinLock(BinType& bin, const ConcurrentMap& owner)
                : m_bin(bin), m_guard(AcquireChecked(bin, owner), Sync::AdoptLock)
            {
                detail::BucketLockRegistry::Push(&m_bin.lock);
            }

            ~BinLock()
            {
                if (m_guard.OwnsLock())
                    detail::BucketLockRegistry::Pop(&m_bin.lock);
            }

            BinLock(const BinLock&)            = delete;
            BinLock& operator=(const BinLock&) = delete;

            void Unlock() noexcept
            {
                if (m_guard.OwnsLock())
                {
                    detail::BucketLockRegistry::Pop(&m_bin.lock);
                    m_guard.Unlock();
                }
            }

        private:
            static Sync::SpinLock& AcquireChecked(BinType& bin, const ConcurrentMap& owner)
            {
#if CASK_CONCURRENT_MAP_REENTRANCY_CHECKS
                if (detail::BucketLockRegistry::IsHeld(&bin.lock))
                {
                    detail::DiagnosticCounters::Bump(owner.m_diagnostics.reentrancyRejections);
                    throw Exceptions::ReentrancyException();
                }
#endif
                if (!bin.lock.TryLock())
                {
                    detail::DiagnosticCounters::Bump(owner.m_diagnostics.lockContentions);
                    bin.lock.Lock();
                }
                return bin.lock;
            }

            BinType&                        m_bin;
            Sync::LockGuard<Sync::SpinLock> m_guard;
        };

        static ConcurrentMapOptions Validated(const ConcurrentMapOptions& options)
        {
            if (auto valid = ValidateOptions(options); !valid)
                throw Exceptions::InvalidConfigurationException(valid.error());
            return options;
        }

        void RejectInsideCallback() const
        {
            if (detail::BucketLockRegistry::Depth() != 0)
            {
                detail::DiagnosticCounters::Bump(m_diagnostics.reentrancyRejections);
                throw Exceptions::ReentrancyException();
            }
        }

        [[nodiscard]] std::size_t ComputeHash(const Key& key) const
        {
            // Spread low-entropy hashes (std::hash<int> is the identity) across the mask bits.
            auto h = static_cast<UInt64>(std::invoke(m_hash, key));
            h ^= h >> 33;
            h *= 0xff51afd7ed558ccdULL;
            h ^= h >> 33;
            return static_cast<std::size_t>(h);
        }

        static BinType& BinAt(const TableType& table, std::size_t hash) noexcept
        {
            return table.bins[hash & table.mask];
        }

        // --- lock-free lookup -------------------------------------------------

        NodeType* FindInIndex(const IndexType& index, const Key& key, std::size_t hash) const
        {
            NodeType** first = index.entries;
            NodeType** last  = index.entries + index.count;
            first            = std::lower_bound(first, last, hash, [](const NodeType* node, std::size_t h) { return node->hash < h; });
            for (; first != last && (*first)->hash == hash; ++first)
            {
                if (m_equal((*first)->key, key))
                    return *first;
            }
            return nullptr;
        }

        NodeType* FindInBin(const TableType& table, const BinType& bin, const Key& key, std::size_t hash) const
        {
            if (const IndexType* index = bin.index.load(std::memory_order_acquire))
                return FindInIndex(*index, key, hash);
            for (NodeType* node = bin.head.load(std::memory_order_acquire); node;
                 node           = node->next[table.link].load(std::memory_order_acquire))
            {
                if (node->hash == hash && m_equal(node->key, key))
                    return node;
            }
            return nullptr;
        }

        /// Caller must hold a reclaimer pin for as long as it uses the returned node.
        ///
        /// Never waits: a bin that is still being split is answered from its frozen chain, and only a
        /// fully Migrated bin sends the lookup on to the successor table.
        NodeType* FindNode(const Key& key, std::size_t hash) const
        {
            const TableType* table = m_table.load(std::memory_order_acquire);
            while (true)
            {
                const BinType& bin = BinAt(*table, hash);
                if (bin.State() != detail::BinState::Migrated)
                    return FindInBin(*table, bin, key, hash);
                table = table->next.load(std::memory_order_acquire);
            }
        }

        // --- locked mutation ----------------------------------------------------

        /// Runs @p mutation with the live bin for @p key locked, then helps or triggers a resize.
        template<class Mutation>
        auto Mutate(const Key& key, Mutation&& mutation)
        {
            const std::size_t hash    = ComputeHash(key);
            WriteOutcome      outcome {};
            auto              result  = [&] {
                auto       pin   = m_reclaimer.Pin();
                TableType* table = m_table.load(std::memory_order_acquire);
                while (true)
                {
                    BinType& bin = BinAt(*table, hash);
                    BinLock  lock(bin, *this);
                    if (bin.State(std::memory_order_relaxed) == detail::BinState::Migrated)
                    {
                        table = table->next.load(std::memory_order_acquire);
                        continue;
                    }
                    return mutation(*table, bin, hash, outcome);
                }
            }();
            AfterWrite(outcome);
            return result;
        }

        Located FindLocked(const TableType& table, BinType& bin, const Key& key, std::size_t hash) const
        {
            NodeType* predecessor = nullptr;
            for (NodeType* node = bin.head.load(std::memory_order_relaxed); node;
                 node           = node->next[table.link].load(std::memory_order_relaxed))
            {
                if (node->hash == hash && m_equal(node->key, key))
                    return {predecessor, node};
                predecessor = node;
            }
            return {};
        }

        static std::optional<Value> CurrentValue(const NodeType& node)
        {
            return node.cell.load(std::memory_order_relaxed)->value;
        }

        template<class... Args>
        CellType* MakeCell(Args&&... args)
        {
            return Memory::AllocateObject<CellType>(m_allocator, std::in_place, std::forward<Args>(args)...);
        }

        void ReplaceCell(NodeType& node, CellType* fresh) noexcept
        {
            CellType* previous = node.cell.exchange(fresh, std::memory_order_acq_rel);
            m_reclaimer.Retire(previous);
        }

        void InsertLocked(TableType& table, BinType& bin, std::size_t hash, const Key& key, CellType* cell,
                          WriteOutcome& outcome)
        {
            NodeType* node = nullptr;
            try
            {
                node = Memory::AllocateObject<NodeType>(m_allocator, hash, key, cell);
            } catch (...)
            {
                Memory::DeallocateObject(m_allocator, cell);
                throw;
            }
            node->next[table.link].store(bin.head.load(std::memory_order_relaxed), std::memory_order_relaxed);
            bin.head.store(node, std::memory_order_release);
            ++bin.length;
            m_size.Increment();
            outcome.inserted = true;
            MaintainIndex(table, bin, outcome);
        }

        void UnlinkLocked(TableType& table, BinType& bin, const Located& found, WriteOutcome& outcome) noexcept
        {
            NodeType* next = found.node->next[table.link].load(std::memory_order_relaxed);
            if (found.predecessor)
                found.predecessor->next[table.link].store(next, std::memory_order_release);
            else
                bin.head.store(next, std::memory_order_release);
            --bin.length;
            m_size.Decrement();
            MaintainIndex(table, bin, outcome);
            m_reclaimer.Retire(found.node->cell.load(std::memory_order_relaxed));
            m_reclaimer.Retire(found.node);
        }

        /// Applies a remapper/combiner result to a located entry: empty removes, a value replaces or inserts.
        std::optional<Value> Commit(TableType& table, BinType& bin, std::size_t hash, const Key& key,
                                    const Located& found, std::optional<Value>&& produced, WriteOutcome& outcome)
        {
            if (!produced)
            {
                if (found.node)
                    UnlinkLocked(table, bin, found, outcome);
                return std::nullopt;
            }
            std::optional<Value> result = *produced;
            if (found.node)
                ReplaceCell(*found.node, MakeCell(std::move(*produced)));
            else
                InsertLocked(table, bin, hash, key, MakeCell(std::move(*produced)), outcome);
            return result;
        }

        // --- dense bin index ----------------------------------------------------

        void MaintainIndex(const TableType& table, BinType& bin, WriteOutcome& outcome) noexcept
        {
            IndexType* current = bin.index.load(std::memory_order_relaxed);
            if (bin.length >= detail::kTreeifyThreshold)
            {
                if (table.capacity >= detail::kMinIndexedCapacity)
                {
                    RebuildIndex(table, bin);
                    return;
                }
                outcome.crowded = true;
            }
            if (!current)
                return;
            if (bin.length <= detail::kUntreeifyThreshold)
            {
                bin.index.store(nullptr, std::memory_order_release);
                m_reclaimer.Retire(current);
                return;
            }
            RebuildIndex(table, bin);
        }

        /// Publishes a fresh index for @p bin's chain. On allocation failure the bin falls back to
        /// chain lookups rather than keeping an index that misses entries.
        void RebuildIndex(const TableType& table, BinType& bin) noexcept
        {
            IndexType* fresh = TryCreateIndex(bin.length);
            if (fresh)
            {
                UIntSize count = 0;
                for (NodeType* node = bin.head.load(std::memory_order_relaxed); node && count < fresh->count;
                     node           = node->next[table.link].load(std::memory_order_relaxed))
                    fresh->entries[count++] = node;
                fresh->count = count;
                std::sort(fresh->entries, fresh->entries + count,
                          [](const NodeType* lhs, const NodeType* rhs) { return lhs->hash < rhs->hash; });
                detail::DiagnosticCounters::Bump(m_diagnostics.indexBuilds);
            }
            if (IndexType* previous = bin.index.exchange(fresh, std::memory_order_acq_rel))
                m_reclaimer.Retire(previous);
        }

        IndexType* TryCreateIndex(UIntSize count) noexcept
        {
            void* raw = m_allocator.Allocate(sizeof(IndexType), alignof(IndexType));
            if (!raw)
                return nullptr;
            auto* entries = static_cast<NodeType**>(m_allocator.Allocate(sizeof(NodeType*) * count, alignof(NodeType*)));
            if (!entries)
            {
                m_allocator.Deallocate(raw, sizeof(IndexType), alignof(IndexType));
                return nullptr;
            }
            auto* index    = ::new (raw) IndexType();
            index->entries = entries;
            index->count   = count;
            index->slots   = count;
            return index;
        }

        void DestroyIndex(IndexType* index) noexcept
        {
            m_allocator.Deallocate(index->entries, sizeof(NodeType*) * index->slots, alignof(NodeType*));
            index->~IndexType();
            m_allocator.Deallocate(index, sizeof(IndexType), alignof(IndexType));
        }

        // --- resize ---------------------------------------------------------------

        TableType* CreateTable(UIntSize binCount, UInt8 link)
        {
            auto* table = Memory::AllocateObject<TableType>(m_allocator);
            try
            {
                table->bins = Memory::AllocateArray<BinType>(m_allocator, binCount);
            } catch (...)
            {
                Memory::DeallocateObject(m_allocator, table);
                throw;
            }
            table->capacity  = binCount;
            table->mask      = binCount - 1;
            table->threshold = ResizeThresholdFor(binCount, m_options.loadFactor);
            table->link      = link;
            return table;
        }

        /// Frees a table's bin array, its indexes and header. Its nodes live on in the successor or
        /// have been freed already.
        void DestroyTableShell(TableType* table) noexcept
        {
            for (UIntSize i = 0; i < table->capacity; ++i)
            {
                if (IndexType* index = table->bins[i].index.load(std::memory_order_relaxed))
                    DestroyIndex(index);
            }
            Memory::DeallocateArray(m_allocator, table->bins, table->capacity);
            Memory::DeallocateObject(m_allocator, table);
        }

        void AfterWrite(const WriteOutcome& outcome)
        {
            // A thread inside a callback holds a bin lock that a resize would need.
            if (detail::BucketLockRegistry::Depth() != 0)
                return;
            for (int attempt = 0; attempt < 2; ++attempt)
            {
                {
                    auto       pin     = m_reclaimer.Pin();
                    TableType* current = m_table.load(std::memory_order_acquire);
                    if (TableType* next = current->next.load(std::memory_order_acquire))
                    {
                        HelpResize(*current, *next, detail::kMigrationStride);
                        return;
                    }
                    const bool overloaded = outcome.inserted && m_size.Load() > current->threshold;
                    const bool crowded    = outcome.crowded && current->capacity < detail::kMinIndexedCapacity;
                    if (!overloaded && !crowded)
                        return;
                    if (StartResize(*current, current->capacity << 1) != ResizeStart::Deferred)
                        return;
                }
                // Unpinned, so this thread does not hold back the table it is waiting on.
                m_reclaimer.TryReclaim();
            }
        }

        /// Attaches a successor of @p targetBins bins to @p current and migrates it to completion.
        ///
        /// The successor threads its chains through the links its grandparent used, so it may only
        /// be created once every retired table has been reclaimed.
        ResizeStart StartResize(TableType& current, UIntSize targetBins)
        {
            targetBins = std::min(std::bit_ceil(targetBins), ConcurrentMapOptions::kMaximumCapacity);
            if (targetBins <= current.capacity)
                return ResizeStart::Started;

            if (TableType* running = current.next.load(std::memory_order_acquire))
            {
                HelpResize(current, *running, detail::kMigrationStride);
                return ResizeStart::Started;
            }
            if (m_tablesAwaitingReclaim.load(std::memory_order_acquire) != 0)
            {
                detail::DiagnosticCounters::Bump(m_diagnostics.resizesDeferred);
                return ResizeStart::Deferred;
            }

            TableType* fresh = nullptr;
            try
            {
                fresh = CreateTable(targetBins, static_cast<UInt8>(current.link ^ 1U));
            } catch (const std::bad_alloc&)
            {
                detail::DiagnosticCounters::Bump(m_diagnostics.resizeAllocationFailures);
                return ResizeStart::AllocationFailed;
            }

            TableType* expected = nullptr;
            if (!current.next.compare_exchange_strong(expected, fresh, std::memory_order_acq_rel, std::memory_order_acquire))
            {
                DestroyTableShell(fresh);
                HelpResize(current, *expected, detail::kMigrationStride);
                return ResizeStart::Started;
            }
            detail::DiagnosticCounters::Bump(m_diagnostics.resizesStarted);
            HelpResize(current, *fresh, detail::kUnboundedMigration);
            return ResizeStart::Started;
        }

        void HelpResize(TableType& from, TableType& to, UIntSize budget) noexcept
        {
            for (UIntSize done = 0; done < budget; ++done)
            {
                const UIntSize index = from.nextClaim.fetch_add(1, std::memory_order_acq_rel);
                if (index >= from.capacity)
                    return;
                MigrateBin(from, to, index);
                if (from.migratedBins.fetch_add(1, std::memory_order_acq_rel) + 1 == from.capacity)
                    FinishResize(from, to);
            }
        }

        /// Threads every node of bin @p index of @p from into its image in @p to through the
        /// successor's link. The source chain and index are left as they are for readers still
        /// walking them.
        void MigrateBin(TableType& from, TableType& to, UIntSize index) noexcept
        {
            BinType&                        bin = from.bins[index];
            Sync::LockGuard<Sync::SpinLock> guard(bin.lock);
            bin.SetState(detail::BinState::Migrating);

            for (NodeType* node = bin.head.load(std::memory_order_relaxed); node;
                 node           = node->next[from.link].load(std::memory_order_relaxed))
            {
                BinType& target = BinAt(to, node->hash);
                node->next[to.link].store(target.head.load(std::memory_order_relaxed), std::memory_order_release);
                target.head.store(node, std::memory_order_release);
                ++target.length;
            }

            if (bin.length >= detail::kTreeifyThreshold && to.capacity >= detail::kMinIndexedCapacity)
            {
                for (UIntSize image = index; image < to.capacity; image += from.capacity)
                {
                    if (to.bins[image].length >= detail::kTreeifyThreshold)
                        RebuildIndex(to, to.bins[image]);
                }
            }
            bin.SetState(detail::BinState::Migrated);
            detail::DiagnosticCounters::Bump(m_diagnostics.binsMigrated);
        }

        void FinishResize(TableType& from, TableType& to) noexcept
        {
            TableType* expected = &from;
            m_table.compare_exchange_strong(expected, &to, std::memory_order_acq_rel, std::memory_order_relaxed);
            m_tablesAwaitingReclaim.fetch_add(1, std::memory_order_acq_rel);
            m_reclaimer.Retire(&from);
            detail::DiagnosticCounters::Bump(m_diagnostics.resizesCompleted);
        }

        /// Completes every in-flight resize. Caller holds a reclaimer pin and no bin lock.
        void DrainResize() noexcept
        {
            while (true)
            {
                TableType* current = m_table.load(std::memory_order_acquire);
                TableType* next    = current->next.load(std::memory_order_acquire);
                if (!next)
                    return;
                HelpResize(*current, *next, detail::kUnboundedMigration);
                // Remaining bins were claimed by other threads; wait for them to publish the successor.
                while (m_table.load(std::memory_order_acquire) == current)
                    std::this_thread::yield();
            }
        }

        /// Calls @p fn(table, bin, lock) for every live bin with its lock held, following migrated
        /// bins into successor tables.
        template<class Fn>
        void ForEachLiveBin(Fn&& fn) const
        {
            struct Pending
            {
                TableType* table;
                UIntSize   index;
            };
            std::vector<Pending> pending;
            TableType*           root = m_table.load(std::memory_order_acquire);
            for (UIntSize i = 0; i < root->capacity; ++i)
            {
                pending.push_back({root, i});
                while (!pending.empty())
                {
                    const Pending item = pending.back();
                    pending.pop_back();
                    BinType& bin = item.table->bins[item.index];
                    BinLock  lock(bin, *this);
                    if (bin.State(std::memory_order_relaxed) == detail::BinState::Migrated)
                    {
                        TableType* next = item.table->next.load(std::memory_order_acquire);
                        lock.Unlock();
                        for (UIntSize image = item.index; image < next->capacity; image += item.table->capacity)
                            pending.push_back({next, image});
                        continue;
                    }
                    fn(*item.table, bin, lock);
                }
            }
        }

        // --- teardown -------------------------------------------------------------

        static void ReclaimThunk(void* context, Memory::Retirable* object) noexcept
        {
            auto* self = static_cast<ConcurrentMap*>(context);
            switch (static_cast<detail::RetiredKind>(object->retiredKind))
            {
                case detail::RetiredKind::Node:
                    Memory::DeallocateObject(self->m_allocator, static_cast<NodeType*>(object));
                    break;
                case detail::RetiredKind::Cell:
                    Memory::DeallocateObject(self->m_allocator, static_cast<CellType*>(object));
                    break;
                case detail::RetiredKind::Index:
                    self->DestroyIndex(static_cast<IndexType*>(object));
                    break;
                case detail::RetiredKind::Table:
                    self->DestroyTableShell(static_cast<TableType*>(object));
                    self->m_tablesAwaitingReclaim.fetch_sub(1, std::memory_order_acq_rel);
                    break;
            }
        }

        void DestroyAll() noexcept
        {
            {
                auto pin = m_reclaimer.Pin();
                DrainResize();
            }
            TableType* table = m_table.exchange(nullptr, std::memory_order_acq_rel);
            for (UIntSize i = 0; i < table->capacity; ++i)
            {
                NodeType* node = table->bins[i].head.load(std::memory_order_relaxed);
                while (node)
                {
                    NodeType* next = node->next[table->link].load(std::memory_order_relaxed);
                    Memory::DeallocateObject(m_allocator, node->cell.load(std::memory_order_relaxed));
                    Memory::DeallocateObject(m_allocator, node);
                    node = next;
                }
            }
            DestroyTableShell(table);
            m_reclaimer.Drain();
        }

        const ConcurrentMapOptions m_options;
        Hash                       m_hash;
        Equal                      m_equal;
        Allocator                  m_allocator;
        std::atomic<TableType*>    m_table {nullptr};
        std::atomic<UIntSize>      m_tablesAwaitingReclaim {0};
        mutable Sync::ShardedCounter       m_size {};
        mutable detail::DiagnosticCounters m_diagnostics {};
        // Declared last so it drains before the allocator it frees into is destroyed.
        mutable Memory::EpochReclaimer m_reclaimer;
    };
}// namespace Cask::Containers
