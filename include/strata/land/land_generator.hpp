#pragma once

#include <strata/land/chunk_biome_pass.hpp>
#include <strata/land/chunk_key.hpp>
#include <strata/land/land_utils.hpp>
#include <strata/land/voxel.hpp>
#include <strata/visibility.hpp>

#include <cstdint>
#include <span>

namespace strata::land
{

// Full chunk generation pipeline: base terrain shaping, surface scan and biome painting.
//
// This class has special multithreaded usage rules: `setSeed` must not
// be called concurrently with anything, all other functions are `const`
// and can be called from any number of threads simultaneously.
class STRATA_API Generator {
public:
	constexpr static int32_t DEFAULT_SEED = Consts::DEFAULT_WORLD_SEED;

	Generator();
	explicit Generator(int32_t seed);
	Generator(Generator &&) = delete;
	Generator(const Generator &) = delete;
	Generator &operator=(Generator &&) = delete;
	Generator &operator=(const Generator &) = delete;
	~Generator() = default;

	void setSeed(int32_t seed);
	int32_t seed() const noexcept { return m_seed; }

	// World-space terrain surface altitude (in blocks) at column (x, z).
	// Voxels with world Y not greater than it are solid.
	float sampleSurfaceHeight(double x, double z) const noexcept;

	// Fill `voxels` (full chunk buffer) with base terrain - stone below
	// surface height, air above it. No biome flags are set.
	// If `open_above` is not null, its bits are set for columns having air
	// right above the chunk (i.e. top layer voxels there can be surface).
	void shapeTerrain(ChunkKey key, std::span<Voxel> voxels, ColumnMask *open_above) const;

	// Generate a complete chunk. Adds painted surface counts
	// per biome variant to `histogram` if it's not null.
	//
	// Throws `Exception` only when biome pass detects broken
	// internal data, the chunk must be considered lost then.
	VoxelBuffer generateChunk(ChunkKey key, ChunkBiomePass::BiomeHistogram *histogram = nullptr) const;

private:
	int32_t m_seed = DEFAULT_SEED;
	uint64_t m_height_sub_seed = 0;

	ChunkBiomePass m_biome_pass;
};

} // namespace strata::land
