/// @file AllocatorConceptTests.cpp
/// @brief Tests for allocator concepts, AllocatorTraits and AllocatorRef.

#include <SOVEC/Memory/AllocatorConcept.hpp>
#include <SOVEC/Memory/AllocatorRef.hpp>
#include <SOVEC/Memory/SystemAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../Support/TestAllocators.hpp"

#include <cstring>
#include <limits>

using SOVEC::Memory::AllocatorConcept;
using SOVEC::Memory::AllocatorReallocates;
using SOVEC::Memory::AllocatorTraits;
using SOVEC::Memory::SystemAllocator;
using SOVEC::Tests::PlainAllocator;
using SOVEC::Tests::TrackedRef;
using SOVEC::Tests::TrackedSystem;

namespace
{
    struct NotAnAllocator
    {
        int Allocate(int) { return 0; }
    };
}// namespace

TEST_CASE("Allocator concepts detect required and optional capabilities", "[Memory][AllocatorConcept]")
{
    STATIC_REQUIRE(AllocatorConcept<SystemAllocator>);
    STATIC_REQUIRE(AllocatorConcept<PlainAllocator>);
    STATIC_REQUIRE(AllocatorConcept<TrackedSystem>);
    STATIC_REQUIRE(AllocatorConcept<TrackedRef>);
    STATIC_REQUIRE_FALSE(AllocatorConcept<NotAnAllocator>);

    STATIC_REQUIRE(AllocatorReallocates<SystemAllocator>);
    STATIC_REQUIRE(AllocatorReallocates<TrackedRef>);
    STATIC_REQUIRE_FALSE(AllocatorReallocates<PlainAllocator>);
}

TEST_CASE("AllocatorTraits supplies defaults for missing capabilities", "[Memory][AllocatorConcept]")
{
    PlainAllocator plain;
    CHECK(AllocatorTraits<PlainAllocator>::MaxSize(plain) == std::numeric_limits<std::size_t>::max());
    CHECK(AllocatorTraits<PlainAllocator>::Owns(plain, &plain));
}

TEST_CASE("AllocatorTraits synthesizes Reallocate from Allocate and Deallocate", "[Memory][AllocatorConcept]")
{
    PlainAllocator plain;
    auto* block = static_cast<char*>(plain.Allocate(8, 1));
    REQUIRE(block != nullptr);
    std::memcpy(block, "abcdefg", 8);

    auto* grown = static_cast<char*>(AllocatorTraits<PlainAllocator>::Reallocate(plain, block, 8, 1, 64));
    REQUIRE(grown != nullptr);
    CHECK(std::strcmp(grown, "abcdefg") == 0);
    plain.Deallocate(grown, 64, 1);
}

TEST_CASE("AllocatorRef forwards every call to the referenced allocator", "[Memory][AllocatorRef]")
{
    TrackedSystem tracked;
    TrackedRef    ref {tracked};
    TrackedRef    copy = ref;

    void* p = ref.Allocate(24, 8);
    REQUIRE(p != nullptr);
    p = copy.Reallocate(p, 24, 8, 48);
    REQUIRE(p != nullptr);
    CHECK(tracked.GetStats().currentBytes == 48U);
    CHECK(&copy.Get() == &tracked);

    copy.Deallocate(p, 48, 8);
    CHECK(tracked.IsBalanced());
}
