#pragma once

#include <strata/land/land_public_consts.hpp>
#include <strata/util/hash.hpp>
#include <strata/visibility.hpp>

#include <fmt/core.h>

#include <glm/vec3.hpp>

#include <bit>
#include <functional>

namespace strata::land
{

// 64-bit packable chunk identifier (position in chunk-space coordinates).
// Useable as search key for associative containers and as seeding input.
//
// Number of bits for coordinate components limits the possible world size.
struct ChunkKey {
	ChunkKey() = default;

	// Construct from packed value, just a bit cast
	explicit ChunkKey(uint64_t packed) noexcept { *this = std::bit_cast<ChunkKey>(packed); }

	// Construct from chunk base position in chunk coordinates
	explicit ChunkKey(glm::ivec3 base) noexcept
	{
		x = base.x;
		y = base.y;
		z = base.z;
	}

	explicit ChunkKey(int32_t x, int32_t y, int32_t z) noexcept : x(x), y(y), z(z) {}

	bool operator==(const ChunkKey &other) const = default;
	bool operator!=(const ChunkKey &other) const = default;
	bool operator<(const ChunkKey &other) const noexcept { return packed() < other.packed(); }

	uint64_t packed() const noexcept { return std::bit_cast<uint64_t>(*this); }

	glm::ivec3 base() const noexcept { return glm::ivec3(x, y, z); }

	// Position of the chunk's minimal corner in world-space block coordinates
	glm::ivec3 blockOrigin() const noexcept { return base() * int32_t(Consts::CHUNK_SIZE_BLOCKS); }

	// Hash is bijective and guarantees no collisions
	uint64_t hash() const noexcept { return Hash::xxh64Fixed(packed()); }

	int64_t x : Consts::CHUNK_KEY_XZ_BITS = 0;
	int64_t y : Consts::CHUNK_KEY_Y_BITS = 0;
	int64_t z : Consts::CHUNK_KEY_XZ_BITS = 0;
};

static_assert(sizeof(ChunkKey) == sizeof(uint64_t));

} // namespace strata::land

namespace fmt
{

// Formats as "(x, y, z)"
template<>
struct STRATA_API formatter<strata::land::ChunkKey> : formatter<string_view> {
	format_context::iterator format(strata::land::ChunkKey key, format_context &ctx) const;
};

} // namespace fmt

namespace std
{

template<>
struct hash<strata::land::ChunkKey> {
	size_t operator()(const strata::land::ChunkKey &ck) const noexcept { return size_t(ck.hash()); }
};

} // namespace std
