#include <strata/land/biome_field.hpp>

#include <strata/land/worley_noise.hpp>

namespace strata::land
{

IBiomeFieldSampler::~IBiomeFieldSampler() noexcept = default;

void WorleyBiomeFieldSampler::sampleField(ChunkKey key, int32_t seed, BiomeField &out) const
{
	constexpr uint32_t N = Consts::CHUNK_SIZE_BLOCKS;

	WorleyNoise noise(uint64_t(uint32_t(seed)));
	noise.setDistanceFunction(WorleyNoise::DistanceFunction::Euclidean)
		.setReturnType(WorleyNoise::ReturnType::Value)
		.setFrequency(Consts::BIOME_NOISE_FREQUENCY);

	const glm::dvec3 origin(key.blockOrigin());
	noise.samplePlane(glm::dvec2(origin.x, origin.x + N), glm::dvec2(origin.z, origin.z + N), N, N, out);
}

const WorleyBiomeFieldSampler &WorleyBiomeFieldSampler::instance() noexcept
{
	static const WorleyBiomeFieldSampler s_instance;
	return s_instance;
}

} // namespace strata::land
