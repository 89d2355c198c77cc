/// @file SystemAllocator.hpp
/// @brief Stateless system allocation wrapper providing aligned allocations.
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <SOVEC/Primitives.hpp>

namespace SOVEC::Memory
{
    struct SystemAllocator
    {
        [[nodiscard]] static bool IsPowerOfTwo(UIntSize v) noexcept
        {
            return v && ((v & (v - 1)) == 0);
        }

        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (!IsPowerOfTwo(alignment))
                alignment = alignof(std::max_align_t);// fallback to safe alignment

#if defined(_WIN32) || defined(_WIN64)
            return _aligned_malloc(size, alignment);
#elif defined(__APPLE__) || defined(__unix__) || defined(__MACH__)
            void* p = nullptr;
            if (alignment < sizeof(void*))
                alignment = sizeof(void*);
            if (posix_memalign(&p, alignment, size) != 0)
                return nullptr;
            return p;
#else
            if (size % alignment != 0)// std::aligned_alloc requires multiple of alignment
                size += alignment - (size % alignment);
            return std::aligned_alloc(alignment, size);
#endif
        }

        void Deallocate(void* ptr, UIntSize, UIntSize) noexcept
        {
            if (!ptr)
                return;
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }

        /// @brief Resize a block previously returned by Allocate.
        /// @return The (possibly moved) block, or nullptr on failure with `ptr` still valid.
        [[nodiscard]] void* Reallocate(void* ptr, UIntSize oldSize, UIntSize alignment, UIntSize newSize) noexcept
        {
            if (!ptr)
                return Allocate(newSize, alignment);
            if (newSize == 0)
                return nullptr;
            if (!IsPowerOfTwo(alignment))
                alignment = alignof(std::max_align_t);

#if defined(_WIN32) || defined(_WIN64)
            return _aligned_realloc(ptr, newSize, alignment);
#else
            // realloc only guarantees fundamental alignment
            if (alignment <= alignof(std::max_align_t))
                return std::realloc(ptr, newSize);

            void* fresh = Allocate(newSize, alignment);
            if (!fresh)
                return nullptr;
            std::memcpy(fresh, ptr, oldSize < newSize ? oldSize : newSize);
            Deallocate(ptr, oldSize, alignment);
            return fresh;
#endif
        }

        [[nodiscard]] constexpr UIntSize MaxSize() const noexcept
        {
            return static_cast<UIntSize>(-1);
        }
        [[nodiscard]] constexpr bool Owns(const void*) const noexcept
        {
            return true;
        }
    };
}// namespace SOVEC::Memory
