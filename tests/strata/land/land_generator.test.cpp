#include <strata/common/thread_pool.hpp>
#include <strata/land/chunk_shape.hpp>
#include <strata/land/land_generator.hpp>

#include "../../strata_test_common.hpp"

#include <future>
#include <numeric>
#include <vector>

namespace strata::land
{

TEST_CASE("'Generator' seed handling", "[strata::land::generator]")
{
	Generator gen;
	CHECK(gen.seed() == Generator::DEFAULT_SEED);

	const float h_default = gen.sampleSurfaceHeight(123.0, -456.0);

	gen.setSeed(-5);
	CHECK(gen.seed() == -5);

	int differences = 0;
	for (int i = 0; i < 16; i++) {
		Generator other(-5);
		CHECK(gen.sampleSurfaceHeight(i * 37.0, i * 11.0) == other.sampleSurfaceHeight(i * 37.0, i * 11.0));

		Generator def;
		if (gen.sampleSurfaceHeight(i * 37.0, i * 11.0) != def.sampleSurfaceHeight(i * 37.0, i * 11.0)) {
			differences++;
		}
	}
	CHECK(differences > 8);

	gen.setSeed(Generator::DEFAULT_SEED);
	CHECK(gen.sampleSurfaceHeight(123.0, -456.0) == h_default);
}

TEST_CASE("'Generator' shapes terrain by surface height", "[strata::land::generator]")
{
	constexpr uint32_t N = Consts::CHUNK_SIZE_BLOCKS;

	Generator gen(2024);
	const ChunkKey key(2, 0, -1);

	VoxelBuffer voxels = makeVoxelBuffer();
	ColumnMask open_above;
	gen.shapeTerrain(key, voxels, &open_above);

	const glm::ivec3 origin = key.blockOrigin();
	bool consistent = true;

	Utils::forXZ<N>([&](uint32_t x, uint32_t z) {
		const float height = gen.sampleSurfaceHeight(double(origin.x + int32_t(x)), double(origin.z + int32_t(z)));

		for (uint32_t y = 0; y < N; y++) {
			const Voxel v = voxels[ChunkVoxelShape::linearize(x, y, z)];
			const bool solid = float(origin.y + int32_t(y)) <= height;

			consistent &= v.flags == 0;
			consistent &= solid ? v.id == Blocks::BlockStone : Blocks::isEmpty(v);
		}

		consistent &= open_above.test(ChunkPlaneShape::linearize(x, z)) == (float(origin.y + int32_t(N)) > height);
	});

	CHECK(consistent);
}

TEST_CASE("'Generator' produces biome-painted chunks", "[strata::land::generator]")
{
	Generator gen(42);

	// Terrain surface stays well within this vertical range. Every column
	// has its surface in exactly one chunk of the vertical stack.
	uint32_t painted_surface = 0;
	for (int32_t y = -3; y <= 3; y++) {
		ChunkBiomePass::BiomeHistogram histogram = {};
		VoxelBuffer voxels = gen.generateChunk(ChunkKey(0, y, 0), &histogram);
		REQUIRE(voxels.size() == Consts::CHUNK_VOLUME_BLOCKS);

		painted_surface += std::accumulate(histogram.begin(), histogram.end(), 0u);
	}

	CHECK(painted_surface == Consts::CHUNK_AREA_BLOCKS);

	// Deterministic
	CHECK(gen.generateChunk(ChunkKey(0, 0, 0)) == gen.generateChunk(ChunkKey(0, 0, 0)));

	// Chunk high above terrain is all air
	CHECK(gen.generateChunk(ChunkKey(0, 100, 0)) == makeVoxelBuffer());
}

TEST_CASE("'Generator' parallel generation equals sequential", "[strata::land::generator]")
{
	Generator gen(777);

	std::vector<ChunkKey> keys;
	for (int32_t z = -1; z <= 1; z++) {
		for (int32_t y = -1; y <= 1; y++) {
			for (int32_t x = -1; x <= 1; x++) {
				keys.emplace_back(x, y, z);
			}
		}
	}

	std::vector<VoxelBuffer> sequential;
	for (ChunkKey key : keys) {
		sequential.emplace_back(gen.generateChunk(key));
	}

	ThreadPool pool(4);
	REQUIRE(pool.threadCount() == 4);

	// Enqueue in reverse order to make scheduling differ
	std::vector<std::future<VoxelBuffer>> futures(keys.size());
	for (size_t i = keys.size(); i-- > 0;) {
		futures[i] = pool.enqueueTask([&gen, key = keys[i]]() { return gen.generateChunk(key); });
	}

	for (size_t i = 0; i < keys.size(); i++) {
		CHECK(futures[i].get() == sequential[i]);
	}
}

} // namespace strata::land
