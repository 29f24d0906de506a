#pragma once

#include <cstdint>

// Publicly accessible constants of Land subsystem
namespace strata::land::Consts
{

// How many blocks fit in one chunk, per axis
constexpr uint32_t CHUNK_SIZE_BLOCKS = 32;

// Number of voxels in one chunk generation buffer
constexpr uint32_t CHUNK_VOLUME_BLOCKS = CHUNK_SIZE_BLOCKS * CHUNK_SIZE_BLOCKS * CHUNK_SIZE_BLOCKS;
// Number of columns (entries of a planar field) in one chunk
constexpr uint32_t CHUNK_AREA_BLOCKS = CHUNK_SIZE_BLOCKS * CHUNK_SIZE_BLOCKS;

// Limits the maximal number of chunks available in X/Z axes. Must be less than 32 bits.
constexpr uint32_t CHUNK_KEY_XZ_BITS = 24;
// Limits the maximal number of chunks available in Y axis. Must be less than 32 bits.
constexpr uint32_t CHUNK_KEY_Y_BITS = 16;

// Inclusive ranges of chunk key components representable by `ChunkKey`
constexpr int32_t MIN_CHUNK_KEY_XZ = -(int32_t(1) << (CHUNK_KEY_XZ_BITS - 1));
constexpr int32_t MAX_CHUNK_KEY_XZ = (int32_t(1) << (CHUNK_KEY_XZ_BITS - 1)) - 1;
constexpr int32_t MIN_CHUNK_KEY_Y = -(int32_t(1) << (CHUNK_KEY_Y_BITS - 1));
constexpr int32_t MAX_CHUNK_KEY_Y = (int32_t(1) << (CHUNK_KEY_Y_BITS - 1)) - 1;

// World seed used when neither config nor commandline provides one
constexpr int32_t DEFAULT_WORLD_SEED = 0x4c'61'6e'64;

// World-space heights (in blocks) are measured from this baseline
constexpr float HEIGHT_BASELINE = -60.0f;

// Water surface altitude
constexpr float SEA_LEVEL = HEIGHT_BASELINE + 76.0f;
// Altitude where terrain becomes "high" - bare mountain rock and snow caps.
// Mountain and snow lines coincide; keep them as one threshold unless some biome needs them apart.
constexpr float HIGH_ALTITUDE_LEVEL = HEIGHT_BASELINE + 100.0f;
constexpr float MOUNTAIN_LEVEL = HIGH_ALTITUDE_LEVEL;
constexpr float SNOW_LEVEL = HIGH_ALTITUDE_LEVEL;

// Sampling frequency of biome attribute noise (per block).
// Low enough for one biome region to span many chunks.
constexpr double BIOME_NOISE_FREQUENCY = 0.008;

// Lower bounds of biome attribute bands, in selection order.
// Changing any of these changes generated worlds, not just code.
constexpr float BIOME_DRY_LAND_MIN_ATTR = 0.1f;
constexpr float BIOME_SNOW_LAND_MIN_ATTR = 0.4f;
constexpr float BIOME_SAND_LAND_MIN_ATTR = 0.6f;
constexpr float BIOME_BLUE_LAND_MIN_ATTR = 0.8f;

} // namespace strata::land::Consts
