/// @file AllocatorRef.hpp
/// @brief Non-owning reference wrapper that adapts an allocator instance to `AllocatorConcept`.
#pragma once

#include <cstddef>

#include <SOVEC/Memory/AllocatorConcept.hpp>

namespace SOVEC::Memory
{
    /// Lets a container store a cheap handle while the allocator (and its state) lives elsewhere.
    /// The referenced allocator must outlive every container using the reference.
    template<AllocatorConcept A>
    class AllocatorRef
    {
    public:
        explicit AllocatorRef(A& a) noexcept : ptr_(&a) {}

        void* Allocate(std::size_t n, std::size_t a) noexcept { return ptr_->Allocate(n, a); }
        void  Deallocate(void* p, std::size_t n, std::size_t a) noexcept { ptr_->Deallocate(p, n, a); }

        // Forwarded through the traits so allocators without Reallocate still work
        void* Reallocate(void* p, std::size_t oldSize, std::size_t align, std::size_t newSize) noexcept
        {
            return AllocatorTraits<A>::Reallocate(*ptr_, p, oldSize, align, newSize);
        }

        std::size_t MaxSize() const noexcept
        {
            return AllocatorTraits<A>::MaxSize(*ptr_);
        }

        [[nodiscard]] bool Owns(const void* p) const noexcept
        {
            return AllocatorTraits<A>::Owns(*ptr_, p);
        }

        [[nodiscard]] A& Get() const noexcept { return *ptr_; }

    private:
        A* ptr_;
    };
}// namespace SOVEC::Memory
