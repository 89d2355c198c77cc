// Fundamental type definitions shared by every SOVEC header.
#pragma once
#include <cstddef>
#include <cstdint>

namespace SOVEC
{
    /// @brief Represents an 8-bit unsigned integer.
    using UInt8 = std::uint8_t;

    /// @brief Represents a byte.
    using Byte = std::byte;

    using UIntSize = std::size_t;
}// namespace SOVEC
