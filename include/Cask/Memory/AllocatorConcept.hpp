/// @file AllocatorConcept.hpp
/// @brief Core allocator concept used by Cask containers.
#pragma once

#include <concepts>
#include <cstddef>

namespace Cask::Memory
{
    // Only Allocate/Deallocate are required. Size and alignment parameters to Deallocate may be
    // ignored by implementations.
    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;// May return nullptr on failure
                { a.Deallocate(p, n, align) } noexcept;
            };
}// namespace Cask::Memory
