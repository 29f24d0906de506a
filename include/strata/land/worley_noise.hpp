#pragma once

#include <strata/visibility.hpp>

#include <glm/vec2.hpp>

#include <cstdint>
#include <span>

namespace strata::land
{

// Cellular (Worley) 2D noise.
//
// Space is divided into unit cells (after frequency scaling), each cell has
// one feature point jittered inside it and one random value, both derived
// by hashing cell coordinates with the seed. Sampling finds the feature point
// nearest to the input point among the 3x3 surrounding cells.
//
// Pure function of (seed, settings, coordinates) - results are bit-exact
// across calls, threads and process restarts.
class STRATA_API WorleyNoise {
public:
	enum class DistanceFunction {
		Euclidean,
		EuclideanSquared,
		Manhattan,
		Chebyshev,
	};

	enum class ReturnType {
		// Random value of the cell owning the nearest feature point, in [-1; 1].
		// Produces flat "patches" with sharp borders.
		Value,
		// Distance to the nearest feature point `d` remapped as `2 * d - 1`.
		// Range depends on distance function, about [-1; 2] for Euclidean.
		Distance,
	};

	constexpr static double DEFAULT_FREQUENCY = 1.0;

	explicit WorleyNoise(uint64_t seed) noexcept;

	WorleyNoise &setDistanceFunction(DistanceFunction fn) noexcept
	{
		m_distance_function = fn;
		return *this;
	}

	WorleyNoise &setReturnType(ReturnType type) noexcept
	{
		m_return_type = type;
		return *this;
	}

	WorleyNoise &setFrequency(double frequency) noexcept
	{
		m_frequency = frequency;
		return *this;
	}

	uint64_t seed() const noexcept { return m_seed; }
	DistanceFunction distanceFunction() const noexcept { return m_distance_function; }
	ReturnType returnType() const noexcept { return m_return_type; }
	double frequency() const noexcept { return m_frequency; }

	// Sample at one world-space point
	double sample(double x, double z) const noexcept;

	// Sample a `width * height` grid over world-space rectangle
	// `[x_bounds.x; x_bounds.y) * [z_bounds.x; z_bounds.y)`.
	// Sample (i, j) is taken at `(x_lo + i * x_step, z_lo + j * z_step)`
	// where `step = (hi - lo) / count` and stored at `out[i + j * width]`.
	//
	// `out` must have at least `width * height` elements.
	void samplePlane(glm::dvec2 x_bounds, glm::dvec2 z_bounds, uint32_t width, uint32_t height,
		std::span<float> out) const noexcept;

private:
	uint64_t m_seed;
	uint64_t m_cell_seed;
	DistanceFunction m_distance_function = DistanceFunction::Euclidean;
	ReturnType m_return_type = ReturnType::Value;
	double m_frequency = DEFAULT_FREQUENCY;
};

} // namespace strata::land
