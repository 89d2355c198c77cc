/// @file InlineStore.hpp
/// @brief Fixed-capacity element storage living inside a SmallVector's own footprint.
#pragma once

#include <SOVEC/Defines.hpp>
#include <SOVEC/Primitives.hpp>
#include <SOVEC/Containers/HeapStore.hpp>

#include <limits>
#include <new>

namespace SOVEC::Containers
{
    /// @brief Inline byte region plus a one-byte tag.
    ///
    /// @details
    /// The region is exactly large and aligned enough to host a `HeapStore<T>` descriptor, with the
    /// tag byte placed after it; the whole slot is `sizeof(HeapStore<T>) + sizeof(UIntSize)` bytes
    /// for ordinary alignments. While the tag is 0..254 the region holds `tag` live elements of `T`.
    /// Tag 255 (`HeapSentinel`) means the owner has placed a heap descriptor in the region and
    /// the inline view is dead for good.
    ///
    /// Never allocates and never fails. Preconditions are checked only by `SOVEC_ASSERT`.
    template<class T>
    class InlineStore
    {
    public:
        using Value = T;

        static constexpr UInt8    HeapSentinel = std::numeric_limits<UInt8>::max();
        static constexpr UIntSize RegionBytes  = sizeof(HeapStore<T>) + sizeof(UIntSize) - 1;
        static constexpr UIntSize Alignment =
                alignof(T) > alignof(HeapStore<T>) ? alignof(T) : alignof(HeapStore<T>);

    private:
        // The tag doubles as the length, so one value is reserved for the sentinel.
        static constexpr UIntSize ComputeCapacity() noexcept
        {
            constexpr UIntSize fit = RegionBytes / sizeof(T);
            return fit < HeapSentinel ? fit : UIntSize(HeapSentinel - 1);
        }

        static_assert(RegionBytes >= sizeof(HeapStore<T>), "Inline region must be able to host a HeapStore.");
        static_assert(Alignment % alignof(HeapStore<T>) == 0, "Inline region must be aligned for a HeapStore.");

    public:
        InlineStore() noexcept = default;

        InlineStore(const InlineStore&)            = delete;
        InlineStore& operator=(const InlineStore&) = delete;

        /// @brief Number of elements that fit inline.
        [[nodiscard]] static constexpr UIntSize Capacity() noexcept { return ComputeCapacity(); }

        [[nodiscard]] bool IsActive() const noexcept { return m_tag != HeapSentinel; }

        /// @pre IsActive()
        [[nodiscard]] UIntSize Size() const noexcept
        {
            SOVEC_ASSERT(IsActive());
            return m_tag;
        }

        /// @pre IsActive(), n <= Capacity(); the caller has constructed/destroyed the delta range.
        void SetSizeUnchecked(UIntSize n) noexcept
        {
            SOVEC_ASSERT(IsActive());
            SOVEC_ASSERT(n <= Capacity());
            m_tag = static_cast<UInt8>(n);
        }

        /// @pre IsActive()
        [[nodiscard]] T* Data() noexcept
        {
            SOVEC_ASSERT(IsActive());
            // launder needs a live element at the address.
            T* first = reinterpret_cast<T*>(m_region);
            return m_tag == 0 ? first : std::launder(first);
        }

        /// @pre IsActive()
        [[nodiscard]] const T* Data() const noexcept
        {
            SOVEC_ASSERT(IsActive());
            const T* first = reinterpret_cast<const T*>(m_region);
            return m_tag == 0 ? first : std::launder(first);
        }

        /// @brief Retire the inline view. Irreversible.
        /// @pre Size() == 0 or the elements have been relocated elsewhere.
        void Deactivate() noexcept { m_tag = HeapSentinel; }

        /// @brief Raw storage of the slot, regardless of which representation occupies it.
        [[nodiscard]] Byte*       Region() noexcept { return m_region; }
        [[nodiscard]] const Byte* Region() const noexcept { return m_region; }

    private:
        alignas(Alignment) Byte m_region[RegionBytes];
        UInt8 m_tag {0};
    };

}// namespace SOVEC::Containers
