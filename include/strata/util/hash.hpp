#pragma once

#include <strata/visibility.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace strata
{

// Collection of hash/checksum utilities
namespace Hash
{

// Fixed-size (64-bit input) XXH64 with zero seed, can be useful to make
// well-distributed bits out of anything. XXH64 is bijective for 64-bit inputs
// so you can even directly compare hashes instead of keys <= 8 bytes.
STRATA_API uint64_t xxh64Fixed(uint64_t data) noexcept;

// Pack two signed 32-bit coordinates into one 64-bit word (X in upper half)
constexpr uint64_t packCoords(int32_t x, int32_t z) noexcept
{
	return (uint64_t(uint32_t(x)) << 32) | uint64_t(uint32_t(z));
}

} // namespace Hash

// Compute fast non-cryptographic CRC32 checksum
STRATA_API uint32_t checksumCrc32(std::span<const std::byte> data) noexcept;

} // namespace strata
