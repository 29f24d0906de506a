#pragma once

#include <strata/visibility.hpp>

#include <glm/vec3.hpp>

#include <string>

namespace cxxopts
{

class Options;
class ParseResult;

} // namespace cxxopts

namespace strata::landgen
{

// Per-run settings of `strata_landgen` that are not stored in config file
class STRATA_API LandgenRuntimeConfig final {
public:
	// Inclusive box of chunk keys to generate
	glm::ivec3 minChunk() const noexcept { return m_min_chunk; }
	glm::ivec3 maxChunk() const noexcept { return m_max_chunk; }
	// Path to INI config file
	const std::string &configPath() const noexcept { return m_config_path; }
	// Whether to write config (with CLI-patched values) back to file
	bool saveConfig() const noexcept { return m_save_config; }

	// Add commandline options related to this config
	static void addOptions(cxxopts::Options &opts);
	// Fill config from parsed commandline options.
	// Throws `Exception` with `StrataErrc::InvalidData` on malformed chunk box.
	void fill(const cxxopts::ParseResult &result);

private:
	glm::ivec3 m_min_chunk { 0, 0, 0 };
	glm::ivec3 m_max_chunk { 0, 0, 0 };
	std::string m_config_path = "strata_landgen.ini";
	bool m_save_config = false;
};

} // namespace strata::landgen
