/// @file SystemAllocatorTests.cpp
/// @brief Tests for SOVEC::Memory::SystemAllocator.

#include <SOVEC/Memory/SystemAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>

using SOVEC::Memory::SystemAllocator;

TEST_CASE("SystemAllocator honours requested alignment", "[Memory][SystemAllocator]")
{
    SystemAllocator alloc;
    for (std::size_t align: {std::size_t {1}, std::size_t {8}, std::size_t {64}, std::size_t {4096}})
    {
        void* p = alloc.Allocate(100, align);
        REQUIRE(p != nullptr);
        CHECK(reinterpret_cast<std::uintptr_t>(p) % align == 0U);
        alloc.Deallocate(p, 100, align);
    }
}

TEST_CASE("SystemAllocator returns null for zero-sized requests", "[Memory][SystemAllocator]")
{
    SystemAllocator alloc;
    CHECK(alloc.Allocate(0, 8) == nullptr);
    alloc.Deallocate(nullptr, 0, 8);
}

TEST_CASE("SystemAllocator Reallocate preserves contents", "[Memory][SystemAllocator]")
{
    SystemAllocator alloc;
    auto* bytes = static_cast<unsigned char*>(alloc.Allocate(32, alignof(int)));
    REQUIRE(bytes != nullptr);
    for (int i = 0; i < 32; ++i)
        bytes[i] = static_cast<unsigned char>(i);

    auto* grown = static_cast<unsigned char*>(alloc.Reallocate(bytes, 32, alignof(int), 4096));
    REQUIRE(grown != nullptr);
    for (int i = 0; i < 32; ++i)
        CHECK(grown[i] == static_cast<unsigned char>(i));

    auto* shrunk = static_cast<unsigned char*>(alloc.Reallocate(grown, 4096, alignof(int), 8));
    REQUIRE(shrunk != nullptr);
    CHECK(shrunk[7] == 7);
    alloc.Deallocate(shrunk, 8, alignof(int));
}

TEST_CASE("SystemAllocator Reallocate keeps over-aligned blocks aligned", "[Memory][SystemAllocator]")
{
    SystemAllocator       alloc;
    constexpr std::size_t align = 256;

    void* p = alloc.Allocate(64, align);
    REQUIRE(p != nullptr);
    std::memset(p, 0x3C, 64);

    void* q = alloc.Reallocate(p, 64, align, 1024);
    REQUIRE(q != nullptr);
    CHECK(reinterpret_cast<std::uintptr_t>(q) % align == 0U);
    CHECK(static_cast<unsigned char*>(q)[63] == 0x3C);
    alloc.Deallocate(q, 1024, align);
}
