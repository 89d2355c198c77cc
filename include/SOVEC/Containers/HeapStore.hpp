/// @file HeapStore.hpp
/// @brief Allocator-backed element buffer (pointer, size, capacity) used once a SmallVector outgrows its slot.
#pragma once

#include <SOVEC/Defines.hpp>
#include <SOVEC/Primitives.hpp>
#include <SOVEC/Memory/AllocatorConcept.hpp>

#include <cstring>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace SOVEC::Containers
{
    namespace detail
    {
        /// @brief Move `count` live elements from `src` into uninitialized `dst`, ending their lifetime in `src`.
        /// @details Trivially copyable types are copied as one block. Otherwise every element is
        /// move-constructed first and the sources are destroyed only once all moves succeeded, so a
        /// throwing move leaves `src` intact and `dst` empty.
        template<class T>
        void RelocateElements(T* src, T* dst, UIntSize count)
        {
            if (count == 0)
                return;
            if constexpr (std::is_trivially_copyable_v<T>)
            {
                std::memcpy(static_cast<void*>(dst), static_cast<const void*>(src), count * sizeof(T));
            }
            else
            {
                UIntSize i = 0;
                try
                {
                    for (; i < count; ++i)
                        ::new (static_cast<void*>(dst + i)) T(std::move(src[i]));
                } catch (...)
                {
                    std::destroy_n(dst, i);
                    throw;
                }
                std::destroy_n(src, count);
            }
        }
    }// namespace detail

    /// @brief Owned, separately allocated storage for elements of `T`.
    ///
    /// @details
    /// A plain descriptor: copying it copies the handle, not the elements. The owner (SmallVector)
    /// decides which copy is live and must call `Release` exactly once with the same allocator
    /// that created it. Element construction/destruction is entirely the owner's job.
    ///
    /// Every allocation failure or byte-size overflow is fatal (`SOVEC_ABORT`).
    template<class T>
    class HeapStore
    {
    public:
        using Value = T;

        /// @brief Allocate room for exactly `capacity` elements; the result holds no elements.
        /// @pre capacity > 0
        template<Memory::AllocatorConcept Alloc>
        [[nodiscard]] static HeapStore CreateWithCapacity(UIntSize capacity, Alloc& alloc) noexcept
        {
            SOVEC_ASSERT(capacity > 0);
            const UIntSize bytes = BytesFor(capacity, alloc);
            void*          mem   = alloc.Allocate(bytes, alignof(T));
            if (SOVEC_UNLIKELY(!mem))
                SOVEC_ABORT("HeapStore: out of memory");
            return HeapStore(static_cast<T*>(mem), capacity);
        }

        /// @brief Move the buffer to exactly `newCapacity` elements, keeping the live prefix.
        /// @pre newCapacity >= Size() and newCapacity > 0
        /// @details Trivially copyable elements go through the allocator's reallocate primitive;
        /// anything else is relocated element by element into a fresh block.
        template<Memory::AllocatorConcept Alloc>
        void GrowTo(UIntSize newCapacity, Alloc& alloc)
        {
            SOVEC_ASSERT(newCapacity > 0);
            SOVEC_ASSERT(newCapacity >= m_size);
            if (newCapacity == m_capacity)
                return;

            const UIntSize oldBytes = m_capacity * sizeof(T);
            const UIntSize newBytes = BytesFor(newCapacity, alloc);

            if constexpr (std::is_trivially_copyable_v<T>)
            {
                void* mem = Memory::AllocatorTraits<Alloc>::Reallocate(alloc, m_data, oldBytes, alignof(T), newBytes);
                if (SOVEC_UNLIKELY(!mem))
                    SOVEC_ABORT("HeapStore: reallocation failed");
                m_data = static_cast<T*>(mem);
            }
            else
            {
                void* mem = alloc.Allocate(newBytes, alignof(T));
                if (SOVEC_UNLIKELY(!mem))
                    SOVEC_ABORT("HeapStore: reallocation failed");
                T* fresh = static_cast<T*>(mem);
                try
                {
                    detail::RelocateElements(m_data, fresh, m_size);
                } catch (...)
                {
                    alloc.Deallocate(mem, newBytes, alignof(T));
                    throw;
                }
                alloc.Deallocate(m_data, oldBytes, alignof(T));
                m_data = fresh;
            }
            m_capacity = newCapacity;
        }

        /// @brief Return the buffer to `alloc`. The descriptor must not be used afterwards.
        /// @pre Size() == 0 (every element already destroyed)
        template<Memory::AllocatorConcept Alloc>
        void Release(Alloc& alloc) noexcept
        {
            SOVEC_ASSERT(m_size == 0);
            SOVEC_ASSERT(m_data != nullptr);
            alloc.Deallocate(m_data, m_capacity * sizeof(T), alignof(T));
            m_data     = nullptr;
            m_capacity = 0;
        }

        [[nodiscard]] UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] UIntSize Capacity() const noexcept { return m_capacity; }

        /// @brief Force the element count.
        /// @pre n <= Capacity(); elements in the grown range are constructed, those in the shrunk range destroyed.
        void SetSizeUnchecked(UIntSize n) noexcept
        {
            SOVEC_ASSERT(n <= m_capacity);
            m_size = n;
        }

        [[nodiscard]] T*       Data() noexcept { return m_data; }
        [[nodiscard]] const T* Data() const noexcept { return m_data; }

    private:
        HeapStore(T* data, UIntSize capacity) noexcept
            : m_data(data), m_size(0), m_capacity(capacity)
        {
        }

        template<class Alloc>
        static UIntSize BytesFor(UIntSize capacity, const Alloc& alloc) noexcept
        {
            if (SOVEC_UNLIKELY(capacity > std::numeric_limits<UIntSize>::max() / sizeof(T)))
                SOVEC_ABORT("HeapStore: capacity overflow");
            const UIntSize bytes = capacity * sizeof(T);
            if (SOVEC_UNLIKELY(bytes > Memory::AllocatorTraits<Alloc>::MaxSize(alloc)))
                SOVEC_ABORT("HeapStore: capacity exceeds allocator limit");
            return bytes;
        }

        T*       m_data;
        UIntSize m_size;
        UIntSize m_capacity;
    };

}// namespace SOVEC::Containers
