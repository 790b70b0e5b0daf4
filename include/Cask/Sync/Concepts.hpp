/// @file Concepts.hpp
/// @brief Concepts for synchronization primitives.
#pragma once

namespace Cask::Sync
{
    template<typename T>
    concept BasicLockableConcept = requires(T lockable) {
        lockable.lock();
        lockable.unlock();
    };
}// namespace Cask::Sync
