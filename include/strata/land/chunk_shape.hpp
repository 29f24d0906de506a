#pragma once

#include <strata/land/land_public_consts.hpp>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include <cassert>
#include <cstdint>

namespace strata::land
{

// Linearization of a cubic N^3 voxel buffer.
//
// Order is XYZ - X changes fastest, then Y, then Z:
//     index = x + y * N + z * N * N
// Every pass touching chunk buffers (base terrain, surface scan,
// biome painting) must address voxels only through this mapping.
template<uint32_t N>
struct ChunkShape {
	static_assert(N > 0);

	constexpr static uint32_t EDGE = N;
	constexpr static uint32_t SIZE = N * N * N;

	constexpr static uint32_t linearize(uint32_t x, uint32_t y, uint32_t z) noexcept
	{
		assert(x < N && y < N && z < N);
		return x + y * N + z * N * N;
	}

	constexpr static uint32_t linearize(glm::uvec3 c) noexcept { return linearize(c.x, c.y, c.z); }

	constexpr static glm::uvec3 delinearize(uint32_t index) noexcept
	{
		assert(index < SIZE);
		const uint32_t x = index % N;
		const uint32_t y = (index / N) % N;
		const uint32_t z = index / (N * N);
		return glm::uvec3(x, y, z);
	}
};

// Linearization of an N^2 planar (XZ) field, one entry per chunk column.
//
// Order is XZ - X changes fastest:
//     index = x + z * N
// Consistent with `ChunkShape<N>`: dropping Y from a chunk
// coordinate and linearizing here yields the column index.
template<uint32_t N>
struct PlaneShape {
	static_assert(N > 0);

	constexpr static uint32_t EDGE = N;
	constexpr static uint32_t SIZE = N * N;

	constexpr static uint32_t linearize(uint32_t x, uint32_t z) noexcept
	{
		assert(x < N && z < N);
		return x + z * N;
	}

	// Takes (x, z) pair - `.y` component of `glm::uvec2` means Z here
	constexpr static uint32_t linearize(glm::uvec2 c) noexcept { return linearize(c.x, c.y); }

	// Returns (x, z) pair - `.y` component of `glm::uvec2` means Z here
	constexpr static glm::uvec2 delinearize(uint32_t index) noexcept
	{
		assert(index < SIZE);
		return glm::uvec2(index % N, index / N);
	}

	// Column index of a chunk buffer index
	constexpr static uint32_t fromChunkIndex(uint32_t chunk_index) noexcept
	{
		const glm::uvec3 c = ChunkShape<N>::delinearize(chunk_index);
		return linearize(c.x, c.z);
	}
};

using ChunkVoxelShape = ChunkShape<Consts::CHUNK_SIZE_BLOCKS>;
using ChunkPlaneShape = PlaneShape<Consts::CHUNK_SIZE_BLOCKS>;

} // namespace strata::land
