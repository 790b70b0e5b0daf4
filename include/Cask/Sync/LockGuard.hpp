/// @file LockGuard.hpp
/// @brief Small RAII helpers for Cask synchronization primitives.
#pragma once

#include <utility>

#include <Cask/Sync/Concepts.hpp>

namespace Cask::Sync
{
    /// @brief Tag selecting the constructor that takes over a lock the caller already holds.
    struct AdoptLockTag
    {
        explicit AdoptLockTag() = default;
    };

    inline constexpr AdoptLockTag AdoptLock {};

    template<BasicLockableConcept TLockable>
    class LockGuard final
    {
    public:
        explicit LockGuard(TLockable& lockable)
            : m_lockable(lockable)
        {
            m_lockable.lock();
        }

        LockGuard(TLockable& lockable, AdoptLockTag) noexcept
            : m_lockable(lockable)
        {
        }

        LockGuard(const LockGuard&)            = delete;
        LockGuard& operator=(const LockGuard&) = delete;

        LockGuard(LockGuard&& other) noexcept
            : m_lockable(other.m_lockable)
            , m_owns(other.m_owns)
        {
            other.m_owns = false;
        }

        LockGuard& operator=(LockGuard&&) = delete;

        ~LockGuard()
        {
            if (m_owns)
            {
                m_lockable.unlock();
            }
        }

        /// @brief Releases the lock before the guard goes out of scope.
        void Unlock()
        {
            if (m_owns)
            {
                m_lockable.unlock();
                m_owns = false;
            }
        }

        [[nodiscard]] bool OwnsLock() const noexcept { return m_owns; }

    private:
        TLockable& m_lockable;
        bool       m_owns {true};
    };
}// namespace Cask::Sync
