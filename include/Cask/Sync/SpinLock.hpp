#pragma once

#include <atomic>
#include <thread>

#include <Cask/Defines.hpp>

namespace Cask::Sync
{
    /// @brief Test-and-test-and-set spin lock with bounded exponential backoff.
    ///
    /// @details
    /// Sized to a single byte so it can be embedded in every bucket of a hash table. Short waits
    /// spin on the CPU relax hint; longer waits yield the time slice.
    class SpinLock
    {
    public:
        SpinLock()                           = default;
        SpinLock(const SpinLock&)            = delete;
        SpinLock& operator=(const SpinLock&) = delete;

        void Lock() noexcept
        {
            int backoff = 1;
            while (true)
            {
                bool wasLocked = m_locked.load(std::memory_order_relaxed);
                if (!wasLocked && m_locked.compare_exchange_weak(wasLocked, true, std::memory_order_acquire))
                    break;

                if (backoff <= kSpinLimit)
                {
                    for (int i = 0; i < backoff; ++i)
                        CASK_CPU_RELAX();
                    backoff *= 2;
                }
                else
                {
                    std::this_thread::yield();
                }
            }
        }

        void Unlock() noexcept
        {
            m_locked.store(false, std::memory_order_release);
        }

        [[nodiscard]] bool TryLock() noexcept
        {
            bool expected = false;
            return !m_locked.load(std::memory_order_relaxed) &&
                   m_locked.compare_exchange_strong(expected, true, std::memory_order_acquire);
        }

        [[nodiscard]] bool IsLocked() const noexcept
        {
            return m_locked.load(std::memory_order_relaxed);
        }

        void lock() noexcept
        {
            Lock();
        }

        void unlock() noexcept
        {
            Unlock();
        }

        [[nodiscard]] bool try_lock() noexcept
        {
            return TryLock();
        }

    private:
        static constexpr int kSpinLimit = 64;

        std::atomic<bool> m_locked {false};
    };
}// namespace Cask::Sync
