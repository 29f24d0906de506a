#pragma once

#include <strata/land/chunk_key.hpp>
#include <strata/land/land_public_consts.hpp>
#include <strata/visibility.hpp>

#include <array>
#include <cstdint>

namespace strata::land
{

// Per-column biome attribute values of one chunk, indexed by `ChunkPlaneShape`
using BiomeField = std::array<float, Consts::CHUNK_AREA_BLOCKS>;

// Source of biome attribute fields. Implementations must be pure functions
// of `(key, seed)` and safe to call concurrently from multiple threads.
class STRATA_API IBiomeFieldSampler {
public:
	IBiomeFieldSampler() = default;
	IBiomeFieldSampler(IBiomeFieldSampler &&) = delete;
	IBiomeFieldSampler(const IBiomeFieldSampler &) = delete;
	IBiomeFieldSampler &operator=(IBiomeFieldSampler &&) = delete;
	IBiomeFieldSampler &operator=(const IBiomeFieldSampler &) = delete;
	virtual ~IBiomeFieldSampler() noexcept;

	virtual void sampleField(ChunkKey key, int32_t seed, BiomeField &out) const = 0;
};

// Default sampler - cellular noise with Euclidean distance returning per-cell
// values, giving patches of uniform attribute with sharp borders.
//
// Samples world-space rectangle covered by the chunk columns, so adjacent
// chunks read adjacent windows of one continuous field (no per-chunk reseeding).
class STRATA_API WorleyBiomeFieldSampler final : public IBiomeFieldSampler {
public:
	WorleyBiomeFieldSampler() = default;
	~WorleyBiomeFieldSampler() noexcept override = default;

	void sampleField(ChunkKey key, int32_t seed, BiomeField &out) const override;

	// Stateless, one shared instance is enough for everyone
	static const WorleyBiomeFieldSampler &instance() noexcept;
};

} // namespace strata::land
