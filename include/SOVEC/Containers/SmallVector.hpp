/// @file SmallVector.hpp
/// @brief Declaration and inline implementation of the SmallVector container class.
/// @details
/// A contiguous sequence that keeps its first few elements inside its own footprint and only
/// allocates once that inline capacity is exceeded. The allocator is stored by value and used for
/// every heap call the container makes; wrap it in `Memory::AllocatorRef` to share one instance.
///
/// Representation: one slot (`InlineStore<T>`) whose byte region holds either the inline
/// elements or, after the one-way transition, a `HeapStore<T>` descriptor. The slot's tag says
/// which one is live. There is no way back from heap to inline for a given object.
///
/// Growth is exact-fit: `ReserveExact` never rounds up, so capacity always equals what was asked
/// for. Pointers returned by `Data()`/`begin()` are invalidated by moving the container and by
/// any call that reallocates or leaves the inline representation.
#pragma once

#include <SOVEC/Defines.hpp>
#include <SOVEC/Primitives.hpp>
#include <SOVEC/Memory/AllocatorConcept.hpp>
#include <SOVEC/Memory/SystemAllocator.hpp>
#include <SOVEC/Containers/HeapStore.hpp>
#include <SOVEC/Containers/InlineStore.hpp>

#include <cstddef>
#include <initializer_list>
#include <limits>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace SOVEC::Containers
{
    /// @tparam T Element type
    /// @tparam Alloc Allocator satisfying AllocatorConcept (value-stored). Defaults to SystemAllocator.
    template<class T, Memory::AllocatorConcept Alloc = Memory::SystemAllocator>
    class SmallVector
    {
        static_assert(!std::is_reference_v<T>, "SmallVector<T&> is not supported.");
        static_assert(std::is_nothrow_destructible_v<T>, "SmallVector requires nothrow-destructible elements.");

        using Inline = InlineStore<T>;
        using Heap   = HeapStore<T>;

        static_assert(alignof(T) > alignof(Heap) || sizeof(Inline) == sizeof(Heap) + sizeof(UIntSize),
                      "Inline slot must stay the size of a heap descriptor plus one word.");

    public:
        using Value     = T;
        using AllocType = Alloc;

        static constexpr UIntSize InlineCapacity = Inline::Capacity();

        SmallVector() noexcept(std::is_nothrow_default_constructible_v<Alloc>) = default;

        explicit SmallVector(Alloc alloc) noexcept
            : alloc_(std::move(alloc))
        {
        }

        /// @brief Empty container able to hold at least `initialCapacity` elements.
        /// @details Stays inline when the request fits; otherwise goes straight to an exact-size heap buffer.
        explicit SmallVector(UIntSize initialCapacity, Alloc alloc = Alloc {})
            : alloc_(std::move(alloc))
        {
            if (initialCapacity > InlineCapacity)
                MoveToHeap(initialCapacity);
        }

        SmallVector(std::initializer_list<T> init, Alloc alloc = Alloc {})
            : alloc_(std::move(alloc))
        {
            ReserveExact(init.size());
            for (const T& v: init)
                Emplace(v);
        }

        SmallVector(const SmallVector& other)
            : alloc_(other.alloc_)
        {
            CopyFrom(other);
        }

        SmallVector& operator=(const SmallVector& other)
        {
            if (this != &other)
            {
                Clear();
                CopyFrom(other);
            }
            return *this;
        }

        SmallVector(SmallVector&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
            : alloc_(std::move(other.alloc_))
        {
            StealFrom(other);
        }

        SmallVector& operator=(SmallVector&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            if (this != &other)
            {
                Destroy();
                ::new (static_cast<void*>(&slot_)) Inline;
                alloc_ = std::move(other.alloc_);
                StealFrom(other);
            }
            return *this;
        }

        ~SmallVector()
        {
            Destroy();
        }

        //=== Observers ===//

        [[nodiscard]] UIntSize Size() const noexcept
        {
            return IsInline() ? slot_.Size() : HeapRef().Size();
        }

        [[nodiscard]] bool Empty() const noexcept
        {
            return Size() == 0;
        }

        /// @brief Elements storable without touching the allocator.
        [[nodiscard]] UIntSize Capacity() const noexcept
        {
            return IsInline() ? InlineCapacity : HeapRef().Capacity();
        }

        /// @brief True until the container has moved its elements to the heap.
        [[nodiscard]] bool IsInline() const noexcept
        {
            return slot_.IsActive();
        }

        [[nodiscard]] const Alloc& GetAllocator() const noexcept
        {
            return alloc_;
        }

        //=== Unchecked access ===//

        /// @brief Force the element count.
        /// @pre n <= Capacity(). Elements in [Size(), n) must already be constructed when growing;
        /// elements in [n, Size()) must already be destroyed when shrinking. Only debug builds check.
        void SetSizeUnchecked(UIntSize n) noexcept
        {
            if (IsInline())
                slot_.SetSizeUnchecked(n);
            else
                HeapRef().SetSizeUnchecked(n);
        }

        /// @brief Raw pointer to the first element.
        /// @warning Invalidated by moving the container and by any call that reallocates or
        /// transitions to the heap representation.
        [[nodiscard]] T* Data() noexcept
        {
            return IsInline() ? slot_.Data() : HeapRef().Data();
        }
        [[nodiscard]] const T* Data() const noexcept
        {
            return IsInline() ? slot_.Data() : HeapRef().Data();
        }

        //=== Capacity management ===//

        /// @brief Make room for `additional` more elements, growing to exactly Size() + additional.
        /// @details No-op if the current capacity already suffices. From inline, this is the one
        /// transition to the heap representation; from heap, the buffer is reallocated in place.
        void ReserveExact(UIntSize additional)
        {
            const UIntSize size = Size();
            if (SOVEC_UNLIKELY(additional > std::numeric_limits<UIntSize>::max() - size))
                SOVEC_ABORT("SmallVector::ReserveExact: capacity overflow");
            const UIntSize target = size + additional;
            if (target <= Capacity())
                return;
            if (IsInline())
                MoveToHeap(target);
            else
                HeapRef().GrowTo(target, alloc_);
        }

        /// @brief Trim heap capacity to the current size. Inline storage is left alone.
        /// @details An empty heap-backed container keeps room for one element.
        void ShrinkToFit()
        {
            if (IsInline())
                return;
            Heap&          heap   = HeapRef();
            const UIntSize target = heap.Size() ? heap.Size() : 1;
            heap.GrowTo(target, alloc_);
        }

        //=== Element modifiers ===//

        /// @brief Append by copy.
        /// @pre Size() < Capacity()
        void Push(const T& value)
        {
            Emplace(value);
        }

        /// @brief Append by move.
        /// @pre Size() < Capacity()
        void Push(T&& value)
        {
            Emplace(std::move(value));
        }

        /// @brief Construct a new last element in place.
        /// @pre Size() < Capacity()
        template<typename... Args>
        T& Emplace(Args&&... args)
        {
            const UIntSize size = Size();
            SOVEC_ASSERT(size < Capacity());
            T* element = ::new (static_cast<void*>(Data() + size)) T(std::forward<Args>(args)...);
            SetSizeUnchecked(size + 1);
            return *element;
        }

        /// @brief Append, growing by exactly one slot when full.
        void PushBack(const T& value)
        {
            EmplaceBack(value);
        }

        void PushBack(T&& value)
        {
            EmplaceBack(std::move(value));
        }

        template<typename... Args>
        T& EmplaceBack(Args&&... args)
        {
            if (Size() < Capacity())
                return Emplace(std::forward<Args>(args)...);
            // Build the value before growing: the arguments may refer to our own elements.
            T value(std::forward<Args>(args)...);
            ReserveExact(1);
            return Emplace(std::move(value));
        }

        /// @brief Remove and return the last element, or nullopt when empty.
        [[nodiscard]] std::optional<T> Pop() noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            const UIntSize size = Size();
            if (size == 0)
                return std::nullopt;
            T*               last = Data() + (size - 1);
            std::optional<T> result {std::in_place, std::move(*last)};
            std::destroy_at(last);
            SetSizeUnchecked(size - 1);
            return result;
        }

        /// @brief Destroy the elements past `newSize`. No-op when `newSize >= Size()`.
        void Truncate(UIntSize newSize) noexcept
        {
            const UIntSize size = Size();
            if (newSize >= size)
                return;
            T* data = Data();
            // Shrink first so a destructor observing the container never sees dead elements.
            SetSizeUnchecked(newSize);
            for (UIntSize i = size; i > newSize; --i)
                std::destroy_at(data + (i - 1));
        }

        /// @brief Remove all elements (capacity and representation remain).
        void Clear() noexcept
        {
            Truncate(0);
        }

        //=== Slice access ===//

        /// @pre index < Size()
        T& operator[](UIntSize index) noexcept
        {
            SOVEC_ASSERT(index < Size());
            return Data()[index];
        }
        const T& operator[](UIntSize index) const noexcept
        {
            SOVEC_ASSERT(index < Size());
            return Data()[index];
        }

        T& At(UIntSize index)
        {
            if (index >= Size())
                throw std::out_of_range("SmallVector::At: index out of range");
            return Data()[index];
        }
        const T& At(UIntSize index) const
        {
            if (index >= Size())
                throw std::out_of_range("SmallVector::At: index out of range");
            return Data()[index];
        }

        T& Front() { return At(0); }
        const T& Front() const { return At(0); }

        T& Back()
        {
            if (Empty())
                throw std::out_of_range("SmallVector::Back: vector is empty");
            return Data()[Size() - 1];
        }
        const T& Back() const
        {
            if (Empty())
                throw std::out_of_range("SmallVector::Back: vector is empty");
            return Data()[Size() - 1];
        }

        [[nodiscard]] std::span<T> AsSpan() noexcept
        {
            return {Data(), Size()};
        }
        [[nodiscard]] std::span<const T> AsSpan() const noexcept
        {
            return {Data(), Size()};
        }

        [[nodiscard]] T* begin() noexcept
        {
            return Data();
        }
        [[nodiscard]] const T* begin() const noexcept
        {
            return Data();
        }
        [[nodiscard]] T* end() noexcept
        {
            return Data() + Size();
        }
        [[nodiscard]] const T* end() const noexcept
        {
            return Data() + Size();
        }

    private:
        /// The descriptor lives in the slot's region once the inline view is retired.
        Heap& HeapRef() noexcept
        {
            SOVEC_ASSERT(!IsInline());
            return *std::launder(reinterpret_cast<Heap*>(slot_.Region()));
        }
        const Heap& HeapRef() const noexcept
        {
            SOVEC_ASSERT(!IsInline());
            return *std::launder(reinterpret_cast<const Heap*>(slot_.Region()));
        }

        /// Inline -> heap, exactly once per object. The heap buffer is filled before the region is
        /// overwritten, so a throwing relocation leaves the container inline and unchanged.
        void MoveToHeap(UIntSize capacity)
        {
            SOVEC_ASSERT(IsInline());
            SOVEC_ASSERT(capacity > InlineCapacity);

            const UIntSize size = slot_.Size();
            Heap           heap = Heap::CreateWithCapacity(capacity, alloc_);
            try
            {
                detail::RelocateElements(slot_.Data(), heap.Data(), size);
            } catch (...)
            {
                heap.Release(alloc_);
                throw;
            }
            heap.SetSizeUnchecked(size);

            ::new (static_cast<void*>(slot_.Region())) Heap(heap);
            slot_.Deactivate();
        }

        void CopyFrom(const SmallVector& other)
        {
            ReserveExact(other.Size());
            for (const T& v: other)
                Emplace(v);
        }

        /// Precondition: *this is empty and inline. Leaves `other` as a fresh, empty inline container.
        void StealFrom(SmallVector& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        {
            if (other.IsInline())
            {
                const UIntSize size = other.slot_.Size();
                detail::RelocateElements(other.slot_.Data(), slot_.Data(), size);
                slot_.SetSizeUnchecked(size);
                other.slot_.SetSizeUnchecked(0);
                return;
            }

            ::new (static_cast<void*>(slot_.Region())) Heap(other.HeapRef());
            slot_.Deactivate();
            ::new (static_cast<void*>(&other.slot_)) Inline;
        }

        void Destroy() noexcept
        {
            Clear();
            if (!IsInline())
                HeapRef().Release(alloc_);
        }

        Inline slot_;
        [[no_unique_address]] Alloc alloc_;
    };

}// namespace SOVEC::Containers
