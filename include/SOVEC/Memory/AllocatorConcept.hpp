/// @file AllocatorConcept.hpp
/// @brief Allocator capability concepts and traits used by every SOVEC container.
#pragma once

#include <concepts>
#include <cstddef>
#include <cstring>
#include <limits>
#include <type_traits>

namespace SOVEC::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept (minimal, hot-path friendly)
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required.
    // Allocate returns nullptr on failure; callers decide whether that is fatal.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;// May return nullptr on failure
                { a.Deallocate(p, n, align) } noexcept;
            };

    // -------------------------------------------------------------------------
    // Optional capabilities (detected with concepts)
    // -------------------------------------------------------------------------

    /// Resizes a block in place or moves it, preserving min(oldSize, newSize) bytes.
    /// Returns nullptr on failure, in which case the original block is left untouched.
    template<class A>
    concept AllocatorReallocates =
            requires(A a, void* p, std::size_t oldSize, std::size_t align, std::size_t newSize) {
                { a.Reallocate(p, oldSize, align, newSize) } -> std::same_as<void*>;
            };

    template<class A>
    concept AllocatorOwnsPointer =
            requires(const A a, const void* p) {
                { a.Owns(p) } -> std::convertible_to<bool>;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    // -------------------------------------------------------------------------
    // Traits with safe defaults
    // -------------------------------------------------------------------------

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasReallocateCapability = AllocatorReallocates<A>;
        static constexpr bool HasOwnsPointerCapability = AllocatorOwnsPointer<A>;
        static constexpr bool HasMaxSizeCapability     = AllocatorReportsMaxSize<A>;

        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
            {
                return allocator.MaxSize();
            }
            else
            {
                return std::numeric_limits<std::size_t>::max();
            }
        }

        // Assume "maybe" when the allocator cannot tell
        static bool Owns(const A& allocator, const void* pointer) noexcept
        {
            if constexpr (HasOwnsPointerCapability)
            {
                return allocator.Owns(pointer);
            }
            else
            {
                return true;
            }
        }

        /// @brief Reallocate through the allocator, or synthesize allocate + copy + deallocate.
        /// @details The synthesized path copies bytes, so it is only meaningful for storage whose
        /// contents may be relocated bitwise.
        static void* Reallocate(A& allocator, void* pointer, std::size_t oldSizeInBytes,
                                std::size_t alignmentInBytes, std::size_t newSizeInBytes) noexcept
        {
            if constexpr (HasReallocateCapability)
            {
                return allocator.Reallocate(pointer, oldSizeInBytes, alignmentInBytes, newSizeInBytes);
            }
            else
            {
                void* fresh = allocator.Allocate(newSizeInBytes, alignmentInBytes);
                if (!fresh)
                    return nullptr;
                if (pointer)
                {
                    const std::size_t bytes = oldSizeInBytes < newSizeInBytes ? oldSizeInBytes : newSizeInBytes;
                    if (bytes != 0)
                        std::memcpy(fresh, pointer, bytes);
                    allocator.Deallocate(pointer, oldSizeInBytes, alignmentInBytes);
                }
                return fresh;
            }
        }
    };

}// namespace SOVEC::Memory
