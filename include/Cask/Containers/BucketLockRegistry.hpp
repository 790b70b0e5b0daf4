/// @file BucketLockRegistry.hpp
/// @brief Per-thread record of the bucket locks the calling thread currently holds.
#pragma once

#include <Cask/Defines.hpp>
#include <Cask/Primitives.hpp>

namespace Cask::Containers::detail
{
    /// @brief Thread-local stack of held bucket locks, used to reject same-bucket re-entry from callbacks.
    ///
    /// Entries are pushed after a lock is acquired and popped before it is released, so the
    /// registry only ever describes the calling thread. Nesting deeper than kMaxTracked is still
    /// counted by Depth() but the extra locks are not individually recognized.
    class BucketLockRegistry
    {
    public:
        static constexpr UIntSize kMaxTracked = 32;

        [[nodiscard]] CASK_BASE_API static bool IsHeld(const void* lock) noexcept;
        CASK_BASE_API static void               Push(const void* lock) noexcept;
        CASK_BASE_API static void               Pop(const void* lock) noexcept;
        [[nodiscard]] CASK_BASE_API static UIntSize Depth() noexcept;
    };
}// namespace Cask::Containers::detail
