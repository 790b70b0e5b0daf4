/// @file AllocationHelpers.hpp
/// @brief Construction/destruction helpers built atop AllocatorConcept.
#pragma once

#include <cstddef>
#include <limits>
#include <new>
#include <type_traits>
#include <utility>

#include <Cask/Memory/AllocatorConcept.hpp>

namespace Cask::Memory
{
    template<class T, AllocatorConcept A, class... Args>
    [[nodiscard]] T* AllocateObject(A& alloc, Args&&... args)
    {
        void* mem = alloc.Allocate(sizeof(T), alignof(T));
        if (!mem)
            throw std::bad_alloc();
        try
        {
            return ::new (mem) T(std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(mem, sizeof(T), alignof(T));
            throw;
        }
    }

    template<AllocatorConcept A, class T>
    void DeallocateObject(A& alloc, T* ptr) noexcept(std::is_nothrow_destructible_v<T>)
    {
        if (!ptr)
            return;
        ptr->~T();
        alloc.Deallocate(ptr, sizeof(T), alignof(T));
    }

    /// @brief Allocates and value-initializes @p count objects. The caller keeps the count for
    ///        the matching DeallocateArray call.
    template<class T, AllocatorConcept A>
    [[nodiscard]] T* AllocateArray(A& alloc, std::size_t count)
    {
        if (count == 0)
            return nullptr;
        if (count > std::numeric_limits<std::size_t>::max() / sizeof(T))
            throw std::bad_alloc();
        auto* arr = static_cast<T*>(alloc.Allocate(sizeof(T) * count, alignof(T)));
        if (!arr)
            throw std::bad_alloc();
        std::size_t i = 0;
        try
        {
            for (; i < count; ++i)
                ::new (static_cast<void*>(arr + i)) T();
        } catch (...)
        {
            for (std::size_t j = 0; j < i; ++j)
                arr[j].~T();
            alloc.Deallocate(arr, sizeof(T) * count, alignof(T));
            throw;
        }
        return arr;
    }

    template<AllocatorConcept A, class T>
    void DeallocateArray(A& alloc, T* arr, std::size_t count) noexcept
    {
        if (!arr)
            return;
        for (std::size_t i = 0; i < count; ++i)
            arr[i].~T();
        alloc.Deallocate(arr, sizeof(T) * count, alignof(T));
    }
}// namespace Cask::Memory
