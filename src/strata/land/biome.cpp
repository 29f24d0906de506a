#include <strata/land/biome.hpp>

#include <strata/debug/bug_found.hpp>
#include <strata/land/chunk_shape.hpp>
#include <strata/land/land_public_consts.hpp>

#include <cassert>

namespace strata::land
{

namespace
{

// Writes blocks into one column of the chunk buffer,
// starting from the surface voxel and going down
class ColumnPainter {
public:
	ColumnPainter(std::span<Voxel> voxels, const ColumnInfo &info) noexcept : m_voxels(voxels), m_info(info)
	{
		assert(voxels.size() == Consts::CHUNK_VOLUME_BLOCKS);
	}

	ColumnPainter &surface(BlockId id) noexcept
	{
		paint(m_info.chunk_index, id);
		m_depth = 0;
		return *this;
	}

	// Paint up to `count` voxels right below the last painted one.
	// Stops at the chunk bottom, at air or at a voxel painted by another pass.
	ColumnPainter &layers(uint32_t count, BlockId id) noexcept
	{
		for (uint32_t i = 0; i < count; i++) {
			if (m_stopped || m_info.local.y < m_depth + 1) {
				m_stopped = true;
				return *this;
			}

			const uint32_t y = m_info.local.y - m_depth - 1;
			const uint32_t index = ChunkVoxelShape::linearize(m_info.local.x, y, m_info.local.z);
			const Voxel &voxel = m_voxels[index];

			if (Blocks::isEmpty(voxel) || voxel.biomeApplied()) {
				m_stopped = true;
				return *this;
			}

			paint(index, id);
			m_depth++;
		}

		return *this;
	}

private:
	std::span<Voxel> m_voxels;
	const ColumnInfo &m_info;
	uint32_t m_depth = 0;
	bool m_stopped = false;

	void paint(uint32_t index, BlockId id) noexcept
	{
		Voxel &voxel = m_voxels[index];
		voxel.id = id;
		voxel.flags |= Voxel::FLAG_BIOME_APPLIED;
	}
};

void paintBasicLand(ColumnPainter &painter, float height)
{
	if (height >= Consts::SNOW_LEVEL) {
		painter.surface(Blocks::BlockSnow);
	} else {
		painter.surface(Blocks::BlockGrass);
	}
}

void paintDryLand(ColumnPainter &painter, float height)
{
	if (height < Consts::SEA_LEVEL) {
		painter.surface(Blocks::BlockGravel);
	} else if (height >= Consts::MOUNTAIN_LEVEL) {
		painter.surface(Blocks::BlockStone);
	} else {
		painter.surface(Blocks::BlockDryGrass).layers(2, Blocks::BlockDirt);
	}
}

void paintSnowLand(ColumnPainter &painter, float height)
{
	if (height < Consts::SEA_LEVEL) {
		painter.surface(Blocks::BlockIce);
	} else {
		painter.surface(Blocks::BlockSnow).layers(1, Blocks::BlockDirt);
	}
}

void paintSandLand(ColumnPainter &painter, float height)
{
	if (height >= Consts::MOUNTAIN_LEVEL) {
		painter.surface(Blocks::BlockStone);
	} else {
		painter.surface(Blocks::BlockSand).layers(3, Blocks::BlockSand).layers(2, Blocks::BlockSandstone);
	}
}

void paintBlueLand(ColumnPainter &painter, float height)
{
	if (height < Consts::SEA_LEVEL) {
		painter.surface(Blocks::BlockWater).layers(1, Blocks::BlockSand);
	} else if (height < Consts::SNOW_LEVEL) {
		painter.surface(Blocks::BlockSand);
	} else {
		painter.surface(Blocks::BlockSnow);
	}
}

} // namespace

BiomeKind selectBiome(float attr) noexcept
{
	if (attr < Consts::BIOME_DRY_LAND_MIN_ATTR) {
		return BiomeKind::BasicLand;
	}

	if (attr < Consts::BIOME_SNOW_LAND_MIN_ATTR) {
		return BiomeKind::DryLand;
	}

	if (attr < Consts::BIOME_SAND_LAND_MIN_ATTR) {
		return BiomeKind::SnowLand;
	}

	if (attr < Consts::BIOME_BLUE_LAND_MIN_ATTR) {
		return BiomeKind::SandLand;
	}

	return BiomeKind::BlueLand;
}

ColumnInfo makeColumnInfo(ChunkKey key, uint32_t chunk_index, uint32_t plane_index) noexcept
{
	const glm::uvec3 local = ChunkVoxelShape::delinearize(chunk_index);
	const auto chunk_bottom = static_cast<int32_t>(key.y) * int32_t(Consts::CHUNK_SIZE_BLOCKS);

	return ColumnInfo {
		.chunk_index = chunk_index,
		.plane_index = plane_index,
		.height = static_cast<float>(chunk_bottom + int32_t(local.y)),
		.local = local,
	};
}

void genLandWithInfo(BiomeKind kind, ChunkKey /*key*/, std::span<Voxel> voxels, uint32_t chunk_index,
	uint32_t plane_index, float height, glm::uvec3 local)
{
	const ColumnInfo info {
		.chunk_index = chunk_index,
		.plane_index = plane_index,
		.height = height,
		.local = local,
	};

	ColumnPainter painter(voxels, info);

	switch (kind) {
	case BiomeKind::BasicLand:
		paintBasicLand(painter, height);
		return;
	case BiomeKind::DryLand:
		paintDryLand(painter, height);
		return;
	case BiomeKind::SnowLand:
		paintSnowLand(painter, height);
		return;
	case BiomeKind::SandLand:
		paintSandLand(painter, height);
		return;
	case BiomeKind::BlueLand:
		paintBlueLand(painter, height);
		return;
	case BiomeKind::EnumSize:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	debug::bugFound("invalid BiomeKind value reached biome dispatch");
}

void genLand(BiomeKind kind, ChunkKey key, std::span<Voxel> voxels, uint32_t chunk_index, uint32_t plane_index)
{
	const ColumnInfo info = makeColumnInfo(key, chunk_index, plane_index);
	genLandWithInfo(kind, key, voxels, info.chunk_index, info.plane_index, info.height, info.local);
}

} // namespace strata::land

namespace extras
{

using strata::land::BiomeKind;

template<>
std::string_view enum_name(BiomeKind value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case BiomeKind::BasicLand:
		return "BasicLand"sv;
	case BiomeKind::DryLand:
		return "DryLand"sv;
	case BiomeKind::SnowLand:
		return "SnowLand"sv;
	case BiomeKind::SandLand:
		return "SandLand"sv;
	case BiomeKind::BlueLand:
		return "BlueLand"sv;
	case BiomeKind::EnumSize:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "Unknown"sv;
}

} // namespace extras
