#include <strata/land/land_utils.hpp>

#include <strata/land/chunk_shape.hpp>

#include <cassert>

namespace strata::land::Utils
{

std::vector<uint32_t> findSurfaceIndices(std::span<const Voxel> voxels, const ColumnMask *open_above)
{
	constexpr uint32_t N = Consts::CHUNK_SIZE_BLOCKS;
	assert(voxels.size() == Consts::CHUNK_VOLUME_BLOCKS);

	std::vector<uint32_t> indices;

	forXZ<N>([&](uint32_t x, uint32_t z) {
		const bool open = !open_above || open_above->test(ChunkPlaneShape::linearize(x, z));

		for (uint32_t y = N; y-- > 0;) {
			const uint32_t index = ChunkVoxelShape::linearize(x, y, z);
			if (Blocks::isEmpty(voxels[index])) {
				continue;
			}

			// Solid voxel with a solid one right above (maybe in another chunk) is not a surface
			if (y + 1 < N || open) {
				indices.emplace_back(index);
			}
			break;
		}
	});

	return indices;
}

} // namespace strata::land::Utils
