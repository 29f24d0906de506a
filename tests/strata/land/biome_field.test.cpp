#include <strata/land/biome_field.hpp>
#include <strata/land/chunk_shape.hpp>
#include <strata/land/worley_noise.hpp>

#include "../../strata_test_common.hpp"

#include <algorithm>
#include <vector>

namespace strata::land
{

TEST_CASE("'WorleyBiomeFieldSampler' is deterministic", "[strata::land::biome_field]")
{
	const auto &sampler = WorleyBiomeFieldSampler::instance();

	BiomeField a;
	BiomeField b;
	sampler.sampleField(ChunkKey(3, -1, -7), 42, a);
	sampler.sampleField(ChunkKey(3, -1, -7), 42, b);
	CHECK(a == b);

	// Vertical position does not matter, the field is planar
	sampler.sampleField(ChunkKey(3, 5, -7), 42, b);
	CHECK(a == b);

	for (float value : a) {
		CHECK(value >= -1.0f);
		CHECK(value <= 1.0f);
	}
}

TEST_CASE("'WorleyBiomeFieldSampler' samples chunk world rectangle", "[strata::land::biome_field]")
{
	const ChunkKey key(-2, 0, 5);

	BiomeField field;
	WorleyBiomeFieldSampler::instance().sampleField(key, -17, field);

	WorleyNoise noise(uint64_t(uint32_t(-17)));
	noise.setFrequency(Consts::BIOME_NOISE_FREQUENCY);

	const glm::ivec3 origin = key.blockOrigin();
	for (uint32_t z = 0; z < Consts::CHUNK_SIZE_BLOCKS; z++) {
		for (uint32_t x = 0; x < Consts::CHUNK_SIZE_BLOCKS; x++) {
			const double value = noise.sample(double(origin.x + int32_t(x)), double(origin.z + int32_t(z)));
			CHECK(field[ChunkPlaneShape::linearize(x, z)] == static_cast<float>(value));
		}
	}
}

TEST_CASE("'WorleyBiomeFieldSampler' is continuous across chunks", "[strata::land::biome_field]")
{
	constexpr uint32_t N = Consts::CHUNK_SIZE_BLOCKS;
	constexpr int32_t SEED = 42;

	// One window spanning two chunks along X
	WorleyNoise noise(uint64_t(uint32_t(SEED)));
	noise.setFrequency(Consts::BIOME_NOISE_FREQUENCY);

	std::vector<float> window(2 * N * N);
	noise.samplePlane(glm::dvec2(0.0, 2.0 * N), glm::dvec2(0.0, double(N)), 2 * N, N, window);

	BiomeField left;
	BiomeField right;
	WorleyBiomeFieldSampler::instance().sampleField(ChunkKey(0, 0, 0), SEED, left);
	WorleyBiomeFieldSampler::instance().sampleField(ChunkKey(1, 0, 0), SEED, right);

	for (uint32_t z = 0; z < N; z++) {
		for (uint32_t x = 0; x < N; x++) {
			CHECK(left[ChunkPlaneShape::linearize(x, z)] == window[x + z * 2 * N]);
			CHECK(right[ChunkPlaneShape::linearize(x, z)] == window[x + N + z * 2 * N]);
		}
	}
}

TEST_CASE("'WorleyBiomeFieldSampler' produces several attribute values", "[strata::land::biome_field]")
{
	// Sample chunks scattered over a large area - it must not degenerate into a single cell value
	BiomeField field;
	float min_value = 1.0f;
	float max_value = -1.0f;

	for (int32_t cz = 0; cz < 8; cz++) {
		for (int32_t cx = 0; cx < 8; cx++) {
			WorleyBiomeFieldSampler::instance().sampleField(ChunkKey(cx * 4, 0, cz * 4), 7, field);
			for (float value : field) {
				min_value = std::min(min_value, value);
				max_value = std::max(max_value, value);
			}
		}
	}

	CHECK(max_value - min_value > 0.5f);
}

} // namespace strata::land
