#include <strata/land/worley_noise.hpp>

#include <strata/util/hash.hpp>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>

namespace strata::land
{

namespace
{

// Mixed into the seed so that the same user seed used by
// other noise functions does not produce correlated cell hashes
constexpr uint64_t CELL_SEED_SALT = 0x57'6f'72'6c'65'79'21'00;

struct CellFeature {
	glm::dvec2 point;
	double value;
};

CellFeature cellFeature(uint64_t cell_seed, int32_t cx, int32_t cz) noexcept
{
	const uint64_t h = Hash::xxh64Fixed(Hash::packCoords(cx, cz) ^ cell_seed);

	// 24 bits per jitter component, 16 bits for the value
	constexpr double JITTER_DIV = 1.0 / double(1u << 24);
	const double jx = double(h & 0xFF'FFFF) * JITTER_DIV;
	const double jz = double((h >> 24) & 0xFF'FFFF) * JITTER_DIV;
	const double value = double(h >> 48) / 65535.0;

	return CellFeature {
		.point = glm::dvec2(double(cx) + jx, double(cz) + jz),
		.value = value * 2.0 - 1.0,
	};
}

double distance(WorleyNoise::DistanceFunction fn, glm::dvec2 a, glm::dvec2 b) noexcept
{
	const glm::dvec2 d = a - b;

	switch (fn) {
	case WorleyNoise::DistanceFunction::Euclidean:
		return std::sqrt(d.x * d.x + d.y * d.y);
	case WorleyNoise::DistanceFunction::EuclideanSquared:
		return d.x * d.x + d.y * d.y;
	case WorleyNoise::DistanceFunction::Manhattan:
		return std::abs(d.x) + std::abs(d.y);
	case WorleyNoise::DistanceFunction::Chebyshev:
		return std::max(std::abs(d.x), std::abs(d.y));
	} // No `default` to make `-Werror -Wswitch` protection work

	return std::numeric_limits<double>::infinity();
}

} // namespace

WorleyNoise::WorleyNoise(uint64_t seed) noexcept : m_seed(seed), m_cell_seed(Hash::xxh64Fixed(seed ^ CELL_SEED_SALT))
{}

double WorleyNoise::sample(double x, double z) const noexcept
{
	const glm::dvec2 point(x * m_frequency, z * m_frequency);

	const auto base_x = static_cast<int32_t>(std::floor(point.x));
	const auto base_z = static_cast<int32_t>(std::floor(point.y));

	double nearest_distance = std::numeric_limits<double>::infinity();
	double nearest_value = 0.0;

	// Fixed visiting order and strict comparison make ties resolve deterministically
	for (int32_t dz = -1; dz <= 1; dz++) {
		for (int32_t dx = -1; dx <= 1; dx++) {
			const CellFeature feature = cellFeature(m_cell_seed, base_x + dx, base_z + dz);
			const double dist = distance(m_distance_function, point, feature.point);

			if (dist < nearest_distance) {
				nearest_distance = dist;
				nearest_value = feature.value;
			}
		}
	}

	switch (m_return_type) {
	case ReturnType::Value:
		return nearest_value;
	case ReturnType::Distance:
		return 2.0 * nearest_distance - 1.0;
	}

	return nearest_value;
}

void WorleyNoise::samplePlane(glm::dvec2 x_bounds, glm::dvec2 z_bounds, uint32_t width, uint32_t height,
	std::span<float> out) const noexcept
{
	assert(out.size() >= size_t(width) * size_t(height));

	const double x_step = (x_bounds.y - x_bounds.x) / double(width);
	const double z_step = (z_bounds.y - z_bounds.x) / double(height);

	for (uint32_t j = 0; j < height; j++) {
		const double sample_z = z_bounds.x + z_step * double(j);

		for (uint32_t i = 0; i < width; i++) {
			const double sample_x = x_bounds.x + x_step * double(i);
			out[size_t(i) + size_t(j) * width] = static_cast<float>(sample(sample_x, sample_z));
		}
	}
}

} // namespace strata::land
