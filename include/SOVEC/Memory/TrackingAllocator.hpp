/// @file TrackingAllocator.hpp
/// @brief Decorator allocator adding allocation statistics (live / peak / totals / imbalance).
#pragma once

#include <cstddef>
#include <utility>

#include <SOVEC/Memory/AllocatorConcept.hpp>

namespace SOVEC::Memory
{
    struct AllocationStats
    {
        std::size_t currentBytes {0};
        std::size_t peakBytes {0};
        std::size_t totalBytes {0};
        std::size_t currentCount {0};// live blocks: allocations minus deallocations
        std::size_t totalCount {0};
        std::size_t deallocationCount {0};
        std::size_t reallocationCount {0};
        std::size_t invalidDeallocations {0};// deallocations with no live block left to match
    };

    /// Counts every call routed through it. A balanced container leaves `currentCount == 0`
    /// and `invalidDeallocations == 0` once it has been destroyed.
    template<AllocatorConcept Inner>
    class Tracking
    {
    public:
        Tracking() = default;
        explicit Tracking(Inner inner) : m_inner(std::move(inner)) {}

        [[nodiscard]] void* Allocate(std::size_t size, std::size_t align) noexcept
        {
            void* p = m_inner.Allocate(size, align);
            if (p)
            {
                AddBytes(size);
                m_stats.currentCount += 1;
                m_stats.totalCount += 1;
            }
            return p;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t align) noexcept
        {
            if (ptr)
            {
                m_stats.deallocationCount += 1;
                if (m_stats.currentCount == 0 || m_stats.currentBytes < size)
                {
                    m_stats.invalidDeallocations += 1;
                }
                else
                {
                    m_stats.currentBytes -= size;
                    m_stats.currentCount -= 1;
                }
            }
            m_inner.Deallocate(ptr, size, align);
        }

        /// A successful reallocation keeps the live block count and moves the byte total.
        [[nodiscard]] void* Reallocate(void* ptr, std::size_t oldSize, std::size_t align, std::size_t newSize) noexcept
        {
            if (!ptr)
                return Allocate(newSize, align);

            void* p = AllocatorTraits<Inner>::Reallocate(m_inner, ptr, oldSize, align, newSize);
            if (p)
            {
                m_stats.reallocationCount += 1;
                if (m_stats.currentCount == 0 || m_stats.currentBytes < oldSize)
                {
                    m_stats.invalidDeallocations += 1;
                    return p;
                }
                m_stats.currentBytes -= oldSize;
                AddBytes(newSize);
            }
            return p;
        }

        [[nodiscard]] std::size_t MaxSize() const noexcept
        {
            return AllocatorTraits<Inner>::MaxSize(m_inner);
        }
        [[nodiscard]] bool Owns(const void* p) const noexcept
        {
            return AllocatorTraits<Inner>::Owns(m_inner, p);
        }

        [[nodiscard]] const AllocationStats& GetStats() const noexcept
        {
            return m_stats;
        }

        /// True when every allocation has been returned exactly once.
        [[nodiscard]] bool IsBalanced() const noexcept
        {
            return m_stats.currentCount == 0 && m_stats.currentBytes == 0 && m_stats.invalidDeallocations == 0;
        }

        Inner& InnerAllocator() noexcept
        {
            return m_inner;
        }
        const Inner& InnerAllocator() const noexcept
        {
            return m_inner;
        }

    private:
        void AddBytes(std::size_t size) noexcept
        {
            m_stats.currentBytes += size;
            m_stats.totalBytes += size;
            if (m_stats.currentBytes > m_stats.peakBytes)
                m_stats.peakBytes = m_stats.currentBytes;
        }

        [[no_unique_address]] Inner m_inner {};
        AllocationStats m_stats {};
    };
}// namespace SOVEC::Memory
