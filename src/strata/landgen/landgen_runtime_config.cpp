#include <strata/landgen/landgen_runtime_config.hpp>

#include <strata/land/land_public_consts.hpp>
#include <strata/util/error_condition.hpp>
#include <strata/util/exception.hpp>
#include <strata/util/log.hpp>

#include <cxxopts.hpp>

#include <vector>

namespace strata::landgen
{

namespace
{

glm::ivec3 parseChunkCoord(const cxxopts::ParseResult &result, const char *name)
{
	const auto &values = result[name].as<std::vector<int32_t>>();
	if (values.size() != 3) {
		Log::error("Option --{} needs exactly 3 comma-separated values, got {}", name, values.size());
		throw Exception::fromError(StrataErrc::InvalidData, "malformed chunk coordinate option");
	}

	const glm::ivec3 coord(values[0], values[1], values[2]);

	using namespace land::Consts;
	const bool xz_ok = coord.x >= MIN_CHUNK_KEY_XZ && coord.x <= MAX_CHUNK_KEY_XZ && coord.z >= MIN_CHUNK_KEY_XZ
		&& coord.z <= MAX_CHUNK_KEY_XZ;
	const bool y_ok = coord.y >= MIN_CHUNK_KEY_Y && coord.y <= MAX_CHUNK_KEY_Y;

	if (!xz_ok || !y_ok) {
		Log::error("Option --{} value ({}, {}, {}) is outside of chunk key range: X/Z in [{}; {}], Y in [{}; {}]", name,
			coord.x, coord.y, coord.z, MIN_CHUNK_KEY_XZ, MAX_CHUNK_KEY_XZ, MIN_CHUNK_KEY_Y, MAX_CHUNK_KEY_Y);
		throw Exception::fromError(StrataErrc::OutOfRange, "chunk coordinate outside of chunk key range");
	}

	return coord;
}

} // namespace

void LandgenRuntimeConfig::addOptions(cxxopts::Options &opts)
{
	// clang-format off: breaks nice chaining syntax
	opts.add_options("Generation")
		("min", "Minimal chunk key of generated box (x,y,z)", cxxopts::value<std::vector<int32_t>>()->default_value("0,0,0"))
		("max", "Maximal chunk key of generated box (x,y,z), inclusive", cxxopts::value<std::vector<int32_t>>()->default_value("0,0,0"))
		("c,config", "Path to config file", cxxopts::value<std::string>()->default_value("strata_landgen.ini"))
		("save-config", "Write config with commandline overrides back to file");
	// clang-format on
}

void LandgenRuntimeConfig::fill(const cxxopts::ParseResult &result)
{
	m_min_chunk = parseChunkCoord(result, "min");
	m_max_chunk = parseChunkCoord(result, "max");
	m_config_path = result["config"].as<std::string>();
	m_save_config = result["save-config"].as<bool>();

	if (m_min_chunk.x > m_max_chunk.x || m_min_chunk.y > m_max_chunk.y || m_min_chunk.z > m_max_chunk.z) {
		Log::error("Chunk box is empty: min ({}, {}, {}) exceeds max ({}, {}, {})", m_min_chunk.x, m_min_chunk.y,
			m_min_chunk.z, m_max_chunk.x, m_max_chunk.y, m_max_chunk.z);
		throw Exception::fromError(StrataErrc::InvalidData, "min chunk key exceeds max chunk key");
	}
}

} // namespace strata::landgen
