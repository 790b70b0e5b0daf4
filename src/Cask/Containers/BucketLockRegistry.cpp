#include <Cask/Containers/BucketLockRegistry.hpp>

#include <array>

namespace Cask::Containers::detail
{
    namespace
    {
        struct HeldLocks
        {
            std::array<const void*, BucketLockRegistry::kMaxTracked> locks {};
            UIntSize                                                 depth {0};
        };

        HeldLocks& ThreadHeldLocks() noexcept
        {
            thread_local HeldLocks held;
            return held;
        }
    }// namespace

    bool BucketLockRegistry::IsHeld(const void* lock) noexcept
    {
        const auto&    held    = ThreadHeldLocks();
        const UIntSize tracked = held.depth < kMaxTracked ? held.depth : kMaxTracked;
        for (UIntSize i = 0; i < tracked; ++i)
        {
            if (held.locks[i] == lock)
                return true;
        }
        return false;
    }

    void BucketLockRegistry::Push(const void* lock) noexcept
    {
        auto& held = ThreadHeldLocks();
        if (held.depth < kMaxTracked)
            held.locks[held.depth] = lock;
        ++held.depth;
    }

    void BucketLockRegistry::Pop(const void* lock) noexcept
    {
        auto& held = ThreadHeldLocks();
        if (held.depth == 0)
            return;
        --held.depth;
        // Guards unwind in LIFO order; the slot being popped is the one that was pushed last.
        if (held.depth < kMaxTracked && held.locks[held.depth] == lock)
            held.locks[held.depth] = nullptr;
    }

    UIntSize BucketLockRegistry::Depth() noexcept
    {
        return ThreadHeldLocks().depth;
    }
}// namespace Cask::Containers::detail
