#include <strata/landgen/landgen_cli.hpp>

#include <strata/common/config.hpp>
#include <strata/common/thread_pool.hpp>
#include <strata/land/biome.hpp>
#include <strata/land/land_generator.hpp>
#include <strata/landgen/landgen_runtime_config.hpp>
#include <strata/util/hash.hpp>
#include <strata/util/log.hpp>

#include <fmt/format.h>

#include <future>
#include <span>

namespace strata::landgen
{

cxxopts::Options makeCliOptions()
{
	cxxopts::Options options("strata_landgen", "Strata - chunk terrain and biome generator");
	Config::Scheme scheme = Config::mainConfigScheme();

	for (Config::SchemeEntry &entry : scheme) {
		std::shared_ptr<cxxopts::Value> default_cli_value;
		switch (entry.default_value.index()) {
		case 0:
			static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
			default_cli_value = cxxopts::value<std::string>();
			break;

		case 1:
			static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
			default_cli_value = cxxopts::value<int64_t>();
			break;

		case 2:
			static_assert(std::is_same_v<double, std::variant_alternative_t<2, Config::option_t>>);
			default_cli_value = cxxopts::value<double>();
			break;

		case 3:
			static_assert(std::is_same_v<bool, std::variant_alternative_t<3, Config::option_t>>);
			// Allows bool flag like `--section__flag` instead of strict `--section__flag=true` form
			default_cli_value = cxxopts::value<bool>()->default_value("true");
			break;

		default:
			static_assert(std::variant_size_v<Config::option_t> == 4);
			break;
		}

		options.add_options(entry.section)(entry.section + std::string(CLI_SECTION_SEPARATOR) + entry.parameter_name,
			entry.description, default_cli_value);
	}

	// clang-format off: breaks nice chaining syntax
	options.add_options()
		("h,help", "Display help information");
	// clang-format on

	LandgenRuntimeConfig::addOptions(options);

	return options;
}

void patchConfig(const cxxopts::ParseResult &result, Config &config, bool save_to_config_file)
{
	for (const auto &keyvalue : result.arguments()) {
		size_t sep_idx = keyvalue.key().find(CLI_SECTION_SEPARATOR);
		if (sep_idx == std::string::npos) {
			continue;
		}

		std::string section = keyvalue.key().substr(0, sep_idx);
		std::string parameter = keyvalue.key().substr(sep_idx + CLI_SECTION_SEPARATOR.size());

		config.patch(section, parameter, keyvalue.value(), save_to_config_file);
	}
}

std::vector<ChunkReport> generateBox(const land::Generator &generator, ThreadPool &pool, glm::ivec3 min,
	glm::ivec3 max)
{
	std::vector<std::future<ChunkReport>> futures;

	for (int32_t z = min.z; z <= max.z; z++) {
		for (int32_t y = min.y; y <= max.y; y++) {
			for (int32_t x = min.x; x <= max.x; x++) {
				const land::ChunkKey key(x, y, z);

				futures.emplace_back(pool.enqueueTask([&generator, key]() {
					ChunkReport report { .key = key };
					land::VoxelBuffer voxels = generator.generateChunk(key, &report.histogram);
					report.checksum = checksumCrc32(std::as_bytes(std::span(voxels)));
					return report;
				}));
			}
		}
	}

	Log::info("Enqueued {} chunks for generation", futures.size());

	// Wait for everything even if something failed, tasks reference `generator`
	for (auto &future : futures) {
		future.wait();
	}

	std::vector<ChunkReport> reports;
	reports.reserve(futures.size());

	for (auto &future : futures) {
		reports.emplace_back(future.get());
	}

	return reports;
}

std::string formatReport(const ChunkReport &report)
{
	using land::BiomeKind;

	std::string text = fmt::format("chunk {} crc32 {:08x}", report.key, report.checksum);

	for (size_t i = 0; i < report.histogram.size(); i++) {
		fmt::format_to(std::back_inserter(text), " {}={}", extras::enum_name(BiomeKind(i)), report.histogram[i]);
	}

	return text;
}

} // namespace strata::landgen
