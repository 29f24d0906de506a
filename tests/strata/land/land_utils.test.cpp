#include <strata/land/chunk_shape.hpp>
#include <strata/land/land_utils.hpp>

#include "../../test_common.hpp"

#include <algorithm>

namespace strata::land
{

TEST_CASE("'findSurfaceIndices' finds topmost solid voxels", "[strata::land::land_utils]")
{
	VoxelBuffer voxels = makeVoxelBuffer();

	auto set = [&](uint32_t x, uint32_t y, uint32_t z) {
		voxels[ChunkVoxelShape::linearize(x, y, z)].id = Blocks::BlockStone;
	};

	// Plain column
	set(0, 0, 0);
	set(0, 1, 0);
	set(0, 2, 0);
	// Overhang - only the top one counts
	set(5, 3, 7);
	set(5, 10, 7);
	// Column reaching the top layer
	set(31, 31, 31);
	set(31, 30, 31);

	SECTION("All columns open above")
	{
		const auto surface = Utils::findSurfaceIndices(voxels);

		REQUIRE(surface.size() == 3);
		// Plane order
		CHECK(surface[0] == ChunkVoxelShape::linearize(0, 2, 0));
		CHECK(surface[1] == ChunkVoxelShape::linearize(5, 10, 7));
		CHECK(surface[2] == ChunkVoxelShape::linearize(31, 31, 31));
	}

	SECTION("Closed column has no surface in this chunk")
	{
		ColumnMask open_above;
		open_above.set();
		open_above.reset(ChunkPlaneShape::linearize(31, 31));
		// Closing a column not reaching the top changes nothing
		open_above.reset(ChunkPlaneShape::linearize(0, 0));

		const auto surface = Utils::findSurfaceIndices(voxels, &open_above);

		REQUIRE(surface.size() == 2);
		CHECK(surface[0] == ChunkVoxelShape::linearize(0, 2, 0));
		CHECK(surface[1] == ChunkVoxelShape::linearize(5, 10, 7));
	}
}

TEST_CASE("'findSurfaceIndices' on empty and full chunks", "[strata::land::land_utils]")
{
	VoxelBuffer voxels = makeVoxelBuffer();
	CHECK(Utils::findSurfaceIndices(voxels).empty());

	std::fill(voxels.begin(), voxels.end(), Voxel { .id = Blocks::BlockStone });
	CHECK(Utils::findSurfaceIndices(voxels).size() == Consts::CHUNK_AREA_BLOCKS);

	ColumnMask closed;
	CHECK(Utils::findSurfaceIndices(voxels, &closed).empty());
}

TEST_CASE("'forXYZ' visits points in buffer order", "[strata::land::land_utils]")
{
	uint32_t expected = 0;
	bool in_order = true;

	Utils::forXYZ<4>([&](uint32_t x, uint32_t y, uint32_t z) {
		in_order &= ChunkShape<4>::linearize(x, y, z) == expected;
		expected++;
	});

	CHECK(in_order);
	CHECK(expected == 64);
}

} // namespace strata::land
