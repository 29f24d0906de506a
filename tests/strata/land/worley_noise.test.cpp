#include <strata/land/worley_noise.hpp>

#include "../../test_common.hpp"

#include <array>
#include <cmath>

namespace strata::land
{

TEST_CASE("'WorleyNoise' is deterministic", "[strata::land::worley_noise]")
{
	WorleyNoise a(1234);
	WorleyNoise b(1234);
	a.setFrequency(0.05);
	b.setFrequency(0.05);

	for (int i = -50; i < 50; i++) {
		const double x = i * 3.7;
		const double z = i * -1.3 + 11.0;
		CHECK(a.sample(x, z) == b.sample(x, z));
		// Repeated sampling of one object too
		CHECK(a.sample(x, z) == a.sample(x, z));
	}
}

TEST_CASE("'WorleyNoise' depends on seed", "[strata::land::worley_noise]")
{
	WorleyNoise a(1);
	WorleyNoise b(2);

	int differences = 0;
	for (int i = 0; i < 64; i++) {
		if (a.sample(i * 1.5, i * 0.5) != b.sample(i * 1.5, i * 0.5)) {
			differences++;
		}
	}

	CHECK(differences > 32);
}

TEST_CASE("'WorleyNoise' value mode", "[strata::land::worley_noise]")
{
	WorleyNoise noise(42);
	CHECK(noise.returnType() == WorleyNoise::ReturnType::Value);
	CHECK(noise.distanceFunction() == WorleyNoise::DistanceFunction::Euclidean);
	CHECK(noise.frequency() == WorleyNoise::DEFAULT_FREQUENCY);

	for (int i = 0; i < 200; i++) {
		const double value = noise.sample(i * 0.37, i * 0.91);
		CHECK(value >= -1.0);
		CHECK(value <= 1.0);
	}

	// Values are constant inside one feature point region, the nearest point
	// can't change by a tiny movement away from region borders (generically)
	int same = 0;
	for (int i = 0; i < 100; i++) {
		const double x = i * 0.77;
		if (noise.sample(x, 0.25) == noise.sample(x + 1e-9, 0.25)) {
			same++;
		}
	}
	CHECK(same >= 95);
}

TEST_CASE("'WorleyNoise' distance mode", "[strata::land::worley_noise]")
{
	WorleyNoise noise(7);
	noise.setReturnType(WorleyNoise::ReturnType::Distance);

	SECTION("Euclidean")
	{
		for (int i = 0; i < 200; i++) {
			const double value = noise.sample(i * 0.13, i * 0.29);
			// Nearest point is never further than 3x3 cell block diagonal
			CHECK(value >= -1.0);
			CHECK(value <= 2.0 * std::sqrt(8.0) - 1.0);
		}
	}

	SECTION("Manhattan is never less than Chebyshev")
	{
		WorleyNoise manhattan(7);
		manhattan.setReturnType(WorleyNoise::ReturnType::Distance)
			.setDistanceFunction(WorleyNoise::DistanceFunction::Manhattan);
		WorleyNoise chebyshev(7);
		chebyshev.setReturnType(WorleyNoise::ReturnType::Distance)
			.setDistanceFunction(WorleyNoise::DistanceFunction::Chebyshev);

		for (int i = 0; i < 200; i++) {
			const double x = i * 0.13;
			const double z = i * 0.29;
			CHECK(manhattan.sample(x, z) >= chebyshev.sample(x, z));
		}
	}
}

TEST_CASE("'WorleyNoise' plane sampling matches point sampling", "[strata::land::worley_noise]")
{
	WorleyNoise noise(99);
	noise.setFrequency(0.1);

	constexpr uint32_t W = 8;
	constexpr uint32_t H = 4;
	std::array<float, W * H> plane;
	noise.samplePlane(glm::dvec2(-16.0, 16.0), glm::dvec2(100.0, 108.0), W, H, plane);

	for (uint32_t j = 0; j < H; j++) {
		for (uint32_t i = 0; i < W; i++) {
			const double x = -16.0 + i * 4.0;
			const double z = 100.0 + j * 2.0;
			CHECK(plane[i + j * W] == static_cast<float>(noise.sample(x, z)));
		}
	}
}

} // namespace strata::land
