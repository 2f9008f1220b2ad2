#pragma once
#include <cstddef>
#include <cstdint>

namespace partbuf
{

// Every property starts on at least an 8-byte boundary, whatever its width.
constexpr std::uint32_t MIN_ALIGNMENT = 8;

constexpr bool is_pow2(std::uint64_t x) noexcept
{
    return x != 0 && (x & (x - 1)) == 0;
}

// Rounds offset up to the next multiple of align (a power of two).
constexpr std::uint64_t align_up(std::uint64_t offset, std::uint64_t align) noexcept
{
    return (offset + (align - 1)) & ~(align - 1);
}

constexpr std::uint32_t element_alignment(std::uint32_t width) noexcept
{
    return width > MIN_ALIGNMENT ? width : MIN_ALIGNMENT;
}

inline bool is_aligned(const void *p, std::uint64_t align) noexcept
{
    return (reinterpret_cast<std::uintptr_t>(p) & (align - 1)) == 0;
}

} // namespace partbuf
