#include <strata/land/chunk_biome_pass.hpp>

#include <strata/land/chunk_shape.hpp>
#include <strata/land/land_utils.hpp>
#include <strata/util/error_condition.hpp>
#include <strata/util/exception.hpp>
#include <strata/util/log.hpp>

#include <cmath>

namespace strata::land
{

void ChunkBiomePass::generate(ChunkKey key, int32_t seed, std::span<const uint32_t> surface, std::span<Voxel> voxels,
	BiomeHistogram *histogram) const
{
	if (surface.empty()) {
		return;
	}

	if (voxels.size() != Consts::CHUNK_VOLUME_BLOCKS) {
		Log::error("Biome pass of chunk {} got voxel buffer of {} elements, expected {}", key, voxels.size(),
			Consts::CHUNK_VOLUME_BLOCKS);
		throw Exception::fromError(StrataErrc::InvalidData, "voxel buffer size does not match chunk volume");
	}

	// Validate everything before touching the buffer
	ColumnMask seen_columns;
	for (uint32_t index : surface) {
		if (index >= Consts::CHUNK_VOLUME_BLOCKS) {
			Log::error("Biome pass of chunk {} got surface index {} out of [0; {})", key, index,
				Consts::CHUNK_VOLUME_BLOCKS);
			throw Exception::fromError(StrataErrc::OutOfRange, "surface index is outside of chunk buffer");
		}

		// Two surfaces in one column would make painting results depend on processing order
		const uint32_t plane_index = ChunkPlaneShape::fromChunkIndex(index);
		if (seen_columns.test(plane_index)) {
			Log::error("Biome pass of chunk {} got second surface index {} in column {}", key, index, plane_index);
			throw Exception::fromError(StrataErrc::InvalidData, "more than one surface index in a column");
		}
		seen_columns.set(plane_index);
	}

	BiomeField field;
	m_sampler.sampleField(key, seed, field);

	for (uint32_t index : surface) {
		const uint32_t plane_index = ChunkPlaneShape::fromChunkIndex(index);
		const float attr = field[plane_index];

		if (!std::isfinite(attr)) {
			Log::error("Biome attribute at column {} of chunk {} is not finite ({})", plane_index, key, attr);
			throw Exception::fromError(StrataErrc::InvalidData, "biome attribute is not a finite number");
		}

		const BiomeKind kind = selectBiome(attr);
		Log::trace("Column {} attribute {} -> {}", plane_index, attr, extras::enum_name(kind));

		genLand(kind, key, voxels, index, plane_index);

		if (histogram) {
			(*histogram)[extras::to_underlying(kind)]++;
		}
	}
}

void biomesGenerate(ChunkKey key, int32_t seed, std::span<const uint32_t> surface, std::span<Voxel> voxels)
{
	ChunkBiomePass().generate(key, seed, surface, voxels);
}

} // namespace strata::land
