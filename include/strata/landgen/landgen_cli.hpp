#pragma once

#include <strata/land/chunk_biome_pass.hpp>
#include <strata/land/chunk_key.hpp>
#include <strata/visibility.hpp>

#include <glm/vec3.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata
{

class Config;
class ThreadPool;

} // namespace strata

namespace strata::land
{

class Generator;

}

namespace strata::landgen
{

// Config options are exposed as `--<section><SEPARATOR><parameter>`
constexpr std::string_view CLI_SECTION_SEPARATOR = "__";

// Options for every main config scheme entry plus runtime ones and `-h,--help`
STRATA_API cxxopts::Options makeCliOptions();

// Override config values with ones explicitly passed in commandline.
// `save_to_config_file` marks patched values to be written on `Config::save()`.
STRATA_API void patchConfig(const cxxopts::ParseResult &result, Config &config, bool save_to_config_file);

struct ChunkReport {
	land::ChunkKey key;
	// CRC32 of raw voxel buffer bytes
	uint32_t checksum = 0;
	land::ChunkBiomePass::BiomeHistogram histogram = {};
};

// Generate every chunk of the inclusive box `[min; max]` using `pool` workers.
// Reports are returned in box iteration order (X fastest, then Y, then Z)
// regardless of which worker generated what. Rethrows the first generation failure.
STRATA_API std::vector<ChunkReport> generateBox(const land::Generator &generator, ThreadPool &pool, glm::ivec3 min,
	glm::ivec3 max);

// One line of `strata_landgen` output
STRATA_API std::string formatReport(const ChunkReport &report);

} // namespace strata::landgen
