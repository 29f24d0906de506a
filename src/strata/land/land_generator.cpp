#include <strata/land/land_generator.hpp>

#include <strata/land/chunk_shape.hpp>
#include <strata/land/land_public_consts.hpp>
#include <strata/util/hash.hpp>
#include <strata/util/log.hpp>

#include <glm/geometric.hpp>
#include <glm/vec2.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>

namespace strata::land
{

namespace
{

constexpr uint64_t HEIGHT_SUB_SEED_SALT = 0x48'65'69'67'68'74'4d'70;

// Terrain oscillates around this altitude
constexpr float BASE_SURFACE_LEVEL = Consts::SEA_LEVEL + 4.0f;

struct NoiseOctave {
	double frequency;
	float amplitude;
};

constexpr NoiseOctave HEIGHT_OCTAVES[] = {
	{ 0.004, 28.0f },
	{ 0.01, 12.0f },
	{ 0.03, 5.0f },
	{ 0.1, 1.5f },
};

glm::vec2 grad(uint64_t seed, int32_t x, int32_t z) noexcept
{
	uint64_t kek = Hash::xxh64Fixed(Hash::packCoords(x, z) ^ seed);

	uint32_t k1 = uint32_t(kek >> 32);
	uint32_t k2 = uint32_t(kek);

	constexpr uint32_t S = 1u << 31;
	constexpr uint32_t M = 16777215u;
	float gx = ((k1 & S) ? -float(k1 & M) : float(k1 & M)) / float(M);
	float gy = ((k2 & S) ? -float(k2 & M) : float(k2 & M)) / float(M);
	return glm::vec2(gx, gy);
}

float sampleRawSimplexNoise(uint64_t seed, double x, double z) noexcept
{
	// Skew/unskew factors for 2D: (sqrt(3) - 1) / 2 and (3 - sqrt(3)) / 6
	constexpr double F = 0.3660254038;
	constexpr double G = 0.2113248654;

	double xskew = x + (x + z) * F;
	double zskew = z + (x + z) * F;

	double x0d = std::floor(xskew);
	double z0d = std::floor(zskew);
	int32_t x0 = static_cast<int32_t>(x0d);
	int32_t z0 = static_cast<int32_t>(z0d);

	glm::dvec2 inner(xskew - x0d, zskew - z0d);

	// Second simplex corner depends on which triangle of the skewed cell we are in
	int32_t x1 = inner.x >= inner.y ? x0 + 1 : x0;
	int32_t z1 = inner.x < inner.y ? z0 + 1 : z0;
	double x1d = double(x1);
	double z1d = double(z1);

	int32_t x2 = x0 + 1;
	int32_t z2 = z0 + 1;
	double x2d = double(x2);
	double z2d = double(z2);

	glm::vec2 r0(x - (x0d - (x0d + z0d) * G), z - (z0d - (x0d + z0d) * G));
	glm::vec2 r1(x - (x1d - (x1d + z1d) * G), z - (z1d - (x1d + z1d) * G));
	glm::vec2 r2(x - (x2d - (x2d + z2d) * G), z - (z2d - (x2d + z2d) * G));

	float d0 = std::max(0.0f, 0.5f - glm::dot(r0, r0));
	float d1 = std::max(0.0f, 0.5f - glm::dot(r1, r1));
	float d2 = std::max(0.0f, 0.5f - glm::dot(r2, r2));

	d0 = d0 * d0;
	d0 = d0 * d0;
	d1 = d1 * d1;
	d1 = d1 * d1;
	d2 = d2 * d2;
	d2 = d2 * d2;

	float g0 = glm::dot(grad(seed, x0, z0), r0);
	float g1 = glm::dot(grad(seed, x1, z1), r1);
	float g2 = glm::dot(grad(seed, x2, z2), r2);

	// Brings the result roughly into [-1; 1]
	return 16.0f * (d0 * g0 + d1 * g1 + d2 * g2);
}

} // namespace

Generator::Generator() : Generator(DEFAULT_SEED) {}

Generator::Generator(int32_t seed)
{
	setSeed(seed);
}

void Generator::setSeed(int32_t seed)
{
	Log::info("Setting land generator seed to {}", seed);

	m_seed = seed;
	m_height_sub_seed = Hash::xxh64Fixed(uint64_t(uint32_t(seed)) ^ HEIGHT_SUB_SEED_SALT);
}

float Generator::sampleSurfaceHeight(double x, double z) const noexcept
{
	float height = BASE_SURFACE_LEVEL;

	for (const NoiseOctave &octave : HEIGHT_OCTAVES) {
		height += octave.amplitude * sampleRawSimplexNoise(m_height_sub_seed, x * octave.frequency, z * octave.frequency);
	}

	return height;
}

void Generator::shapeTerrain(ChunkKey key, std::span<Voxel> voxels, ColumnMask *open_above) const
{
	constexpr uint32_t N = Consts::CHUNK_SIZE_BLOCKS;
	assert(voxels.size() == Consts::CHUNK_VOLUME_BLOCKS);

	const glm::ivec3 origin = key.blockOrigin();

	if (open_above) {
		open_above->reset();
	}

	Utils::forXZ<N>([&](uint32_t x, uint32_t z) {
		const float height = sampleSurfaceHeight(double(origin.x + int32_t(x)), double(origin.z + int32_t(z)));

		for (uint32_t y = 0; y < N; y++) {
			const float world_y = float(origin.y + int32_t(y));
			Voxel &voxel = voxels[ChunkVoxelShape::linearize(x, y, z)];

			voxel = Voxel {};
			if (world_y <= height) {
				voxel.id = Blocks::BlockStone;
			}
		}

		if (open_above && float(origin.y + int32_t(N)) > height) {
			open_above->set(ChunkPlaneShape::linearize(x, z));
		}
	});
}

VoxelBuffer Generator::generateChunk(ChunkKey key, ChunkBiomePass::BiomeHistogram *histogram) const
{
	VoxelBuffer voxels = makeVoxelBuffer();

	ColumnMask open_above;
	shapeTerrain(key, voxels, &open_above);

	const std::vector<uint32_t> surface = Utils::findSurfaceIndices(voxels, &open_above);
	m_biome_pass.generate(key, m_seed, surface, voxels, histogram);

	Log::debug("Generated chunk {} with {} surface columns", key, surface.size());
	return voxels;
}

} // namespace strata::land
