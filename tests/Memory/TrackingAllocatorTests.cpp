/// @file TrackingAllocatorTests.cpp
/// @brief Tests for Tracking allocator decorator.

#include <SOVEC/Memory/SystemAllocator.hpp>
#include <SOVEC/Memory/TrackingAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../Support/TestAllocators.hpp"

#include <cstddef>

using SOVEC::Tests::PlainAllocator;
using SOVEC::Tests::TrackedSystem;

TEST_CASE("Tracking allocator accumulates statistics", "[Memory][TrackingAllocator]")
{
    TrackedSystem tracked {SOVEC::Memory::SystemAllocator {}};

    void* first  = tracked.Allocate(64, alignof(std::max_align_t));
    void* second = tracked.Allocate(32, alignof(std::max_align_t));
    REQUIRE(first != nullptr);
    REQUIRE(second != nullptr);

    auto stats = tracked.GetStats();
    CHECK(stats.currentBytes == 96U);
    CHECK(stats.peakBytes == 96U);
    CHECK(stats.currentCount == 2U);
    CHECK_FALSE(tracked.IsBalanced());

    tracked.Deallocate(first, 64, alignof(std::max_align_t));
    CHECK(tracked.GetStats().currentBytes == 32U);

    tracked.Deallocate(second, 32, alignof(std::max_align_t));
    stats = tracked.GetStats();
    CHECK(stats.currentBytes == 0U);
    CHECK(stats.peakBytes == 96U);
    CHECK(stats.totalCount == 2U);
    CHECK(stats.deallocationCount == 2U);
    CHECK(tracked.IsBalanced());
}

TEST_CASE("Tracking allocator follows reallocations without changing the block count", "[Memory][TrackingAllocator]")
{
    TrackedSystem tracked;

    void* block = tracked.Allocate(16, alignof(int));
    REQUIRE(block != nullptr);

    block = tracked.Reallocate(block, 16, alignof(int), 256);
    REQUIRE(block != nullptr);

    auto stats = tracked.GetStats();
    CHECK(stats.currentCount == 1U);
    CHECK(stats.currentBytes == 256U);
    CHECK(stats.peakBytes == 256U);
    CHECK(stats.reallocationCount == 1U);
    CHECK(stats.totalCount == 1U);

    tracked.Deallocate(block, 256, alignof(int));
    CHECK(tracked.IsBalanced());
}

TEST_CASE("Tracking allocator flags deallocations without a live block", "[Memory][TrackingAllocator]")
{
    // The block comes from a sibling allocator over the same system heap, so freeing it is safe;
    // only the tracked bookkeeping goes out of balance.
    SOVEC::Memory::Tracking<PlainAllocator> tracked;
    PlainAllocator                          outside;

    void* foreign = outside.Allocate(8, alignof(int));
    REQUIRE(foreign != nullptr);
    tracked.Deallocate(foreign, 8, alignof(int));

    CHECK(tracked.GetStats().invalidDeallocations == 1U);
    CHECK_FALSE(tracked.IsBalanced());
}

TEST_CASE("Tracking allocator ignores null deallocations", "[Memory][TrackingAllocator]")
{
    TrackedSystem tracked;
    tracked.Deallocate(nullptr, 0, alignof(int));
    CHECK(tracked.GetStats().deallocationCount == 0U);
    CHECK(tracked.IsBalanced());
}
