#pragma once

#include <strata/land/land_public_consts.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

namespace strata::land
{

using BlockId = uint16_t;

// One unit cell of chunk content. Trivially copyable, buffers
// of it are compared and checksummed as raw bytes.
struct Voxel {
	// Set when a biome pass has written this voxel
	constexpr static uint8_t FLAG_BIOME_APPLIED = 1u << 0;

	BlockId id = 0;
	uint8_t flags = 0;
	uint8_t reserved = 0;

	bool operator==(const Voxel &other) const = default;

	bool biomeApplied() const noexcept { return (flags & FLAG_BIOME_APPLIED) != 0; }
};

static_assert(sizeof(Voxel) == 4);

// Dense chunk generation buffer, indexed by `ChunkVoxelShape` linearization.
// Always has exactly `Consts::CHUNK_VOLUME_BLOCKS` elements.
using VoxelBuffer = std::vector<Voxel>;

// Hardcoded block catalogue - only what terrain and biome generation needs.
// Block registry with properties is the job of game content layer.
class Blocks {
public:
	enum Block : BlockId {
		BlockEmpty = 0,

		BlockStone,
		BlockDirt,
		BlockGrass,
		BlockDryGrass,
		BlockSand,
		BlockSandstone,
		BlockSnow,
		BlockIce,
		BlockWater,
		BlockGravel,

		BlockCount
	};

	constexpr static BlockId NUM_BLOCKS = BlockCount;

	constexpr static const char *BLOCK_NAME[NUM_BLOCKS] = {
		"Empty",

		"Stone",
		"Dirt",
		"Grass",
		"DryGrass",
		"Sand",
		"Sandstone",
		"Snow",
		"Ice",
		"Water",
		"Gravel",
	};

	static bool isEmpty(Voxel v) noexcept { return v.id == BlockEmpty; }

	static std::string_view name(BlockId id) noexcept
	{
		return id < NUM_BLOCKS ? std::string_view(BLOCK_NAME[id]) : std::string_view("Unknown");
	}
};

// Allocate an all-air chunk buffer
inline VoxelBuffer makeVoxelBuffer()
{
	return VoxelBuffer(Consts::CHUNK_VOLUME_BLOCKS);
}

} // namespace strata::land
