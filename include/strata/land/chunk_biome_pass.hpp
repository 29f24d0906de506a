#pragma once

#include <strata/land/biome.hpp>
#include <strata/land/biome_field.hpp>
#include <strata/land/chunk_key.hpp>
#include <strata/land/voxel.hpp>
#include <strata/visibility.hpp>

#include <array>
#include <cstdint>
#include <span>

namespace strata::land
{

// Biome painting pass over one chunk. Samples biome attribute field once,
// then selects a biome variant for every surface voxel and lets it paint the column.
//
// Stateless apart from the sampler reference, one object can serve any number
// of threads as long as the sampler allows it (all built-in samplers do).
class STRATA_API ChunkBiomePass {
public:
	// Number of painted surface voxels per biome variant
	using BiomeHistogram = std::array<uint32_t, extras::enum_size_v<BiomeKind>>;

	// `sampler` must outlive this object
	explicit ChunkBiomePass(const IBiomeFieldSampler &sampler = WorleyBiomeFieldSampler::instance()) noexcept
		: m_sampler(sampler)
	{}

	// Paint biomes over `voxels` - full chunk buffer of `key` - at positions
	// listed in `surface` (linear buffer indices, order does not matter,
	// at most one index per column).
	// Adds painted surface counts to `histogram` if it's not null.
	//
	// Empty `surface` returns immediately, not even sampling the field.
	//
	// Throws `Exception` with `StrataErrc::InvalidData` if `voxels` has wrong size,
	// if two surface indices share a column or if the sampled attribute is not finite.
	// Throws with `StrataErrc::OutOfRange` if any surface index is outside of the buffer.
	// Buffer is not modified when index validation fails. After a non-finite attribute
	// error `voxels` contents are unspecified and must be discarded.
	void generate(ChunkKey key, int32_t seed, std::span<const uint32_t> surface, std::span<Voxel> voxels,
		BiomeHistogram *histogram = nullptr) const;

	const IBiomeFieldSampler &sampler() const noexcept { return m_sampler; }

private:
	const IBiomeFieldSampler &m_sampler;
};

// Run `ChunkBiomePass` with the default sampler
STRATA_API void biomesGenerate(ChunkKey key, int32_t seed, std::span<const uint32_t> surface,
	std::span<Voxel> voxels);

} // namespace strata::land
