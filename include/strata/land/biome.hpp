#pragma once

#include <strata/land/chunk_key.hpp>
#include <strata/land/voxel.hpp>
#include <strata/visibility.hpp>

#include <extras/enum_utils.hpp>

#include <glm/vec3.hpp>

#include <cstdint>
#include <span>

namespace strata::land
{

// Closed set of biome variants. Variants carry no state,
// all behavior is dispatched by switching over this value.
enum class BiomeKind : uint8_t {
	BasicLand,
	DryLand,
	SnowLand,
	SandLand,
	BlueLand,

	EnumSize
};

// Map biome attribute value to its variant using half-open bands
// with lower bounds from `Consts::BIOME_*_MIN_ATTR`:
//     (-inf; 0.1) [0.1; 0.4) [0.4; 0.6) [0.6; 0.8) [0.8; +inf)
// Infinities fall into the outermost bands. NaN is not a valid input.
STRATA_API BiomeKind selectBiome(float attr) noexcept;

// Location of one surface voxel, as seen by biome painters
struct ColumnInfo {
	// Index into chunk voxel buffer (`ChunkVoxelShape`)
	uint32_t chunk_index;
	// Index into chunk planar fields (`ChunkPlaneShape`).
	// Built-in variants don't read it, reserved for ones needing per-column planar data.
	uint32_t plane_index;
	// World-space altitude in blocks: `key.y * CHUNK_SIZE_BLOCKS + local.y`
	float height;
	// Position inside the chunk
	glm::uvec3 local;
};

STRATA_API ColumnInfo makeColumnInfo(ChunkKey key, uint32_t chunk_index, uint32_t plane_index) noexcept;

// Paint one surface voxel (and possibly some voxels below it in the same column)
// according to biome variant rules. Every written voxel gets `Voxel::FLAG_BIOME_APPLIED`.
// Voxels outside of `chunk_index` column are never touched.
//
// `voxels` must be a full chunk buffer and `chunk_index` must be within it.
// Built-in variants decide only by `height` and `local`. `key` and `plane_index`
// are reserved for variants needing chunk-wide or per-column planar data
// and do not affect the result for now.
STRATA_API void genLandWithInfo(BiomeKind kind, ChunkKey key, std::span<Voxel> voxels, uint32_t chunk_index,
	uint32_t plane_index, float height, glm::uvec3 local);

// Same as above, deriving height and local position from `key` and `chunk_index`
STRATA_API void genLand(BiomeKind kind, ChunkKey key, std::span<Voxel> voxels, uint32_t chunk_index,
	uint32_t plane_index);

} // namespace strata::land

namespace extras
{

template<>
STRATA_API std::string_view enum_name(strata::land::BiomeKind value) noexcept;

}
