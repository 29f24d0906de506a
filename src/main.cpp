#include <strata/common/config.hpp>
#include <strata/common/thread_pool.hpp>
#include <strata/land/land_generator.hpp>
#include <strata/landgen/landgen_cli.hpp>
#include <strata/landgen/landgen_runtime_config.hpp>
#include <strata/util/exception.hpp>
#include <strata/util/log.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdio>
#include <cstdlib>

int main(int argc, char *argv[])
{
	using strata::Log;

	try {
		cxxopts::Options opts = strata::landgen::makeCliOptions();
		cxxopts::ParseResult parsed;

		try {
			parsed = opts.parse(argc, argv);
		}
		catch (const cxxopts::exceptions::exception &e) {
			printf("%s\n\n%s\n", e.what(), opts.help().c_str());
			return EXIT_FAILURE;
		}

		if (parsed.count("help")) {
			printf("%s\n", opts.help().c_str());
			return EXIT_SUCCESS;
		}

		if (const auto &unmatched = parsed.unmatched(); !unmatched.empty()) {
			printf("Unknown arguments provided:\n%s\n\n%s\n", fmt::format("{}", unmatched).c_str(), opts.help().c_str());
			return EXIT_FAILURE;
		}

		strata::landgen::LandgenRuntimeConfig runtime_config;
		runtime_config.fill(parsed);

		strata::Config config(runtime_config.configPath(), strata::Config::mainConfigScheme());
		strata::landgen::patchConfig(parsed, config, runtime_config.saveConfig());

		Log::setLevel(Log::levelFromString(config.getString("log", "level"), Log::Level::Info));

		if (runtime_config.saveConfig()) {
			config.save();
		}

		const int32_t threads = config.getInt32("landgen", "threads");
		if (threads < 0) {
			Log::fatal("Thread count can't be negative (got {})", threads);
			return EXIT_FAILURE;
		}

		strata::land::Generator generator(config.getInt32("world", "seed"));
		std::vector<strata::landgen::ChunkReport> reports;

		{
			strata::ThreadPool pool(static_cast<size_t>(threads));
			reports = strata::landgen::generateBox(generator, pool, runtime_config.minChunk(),
				runtime_config.maxChunk());
		}

		for (const auto &report : reports) {
			fmt::print("{}\n", strata::landgen::formatReport(report));
		}
	}
	catch (const strata::Exception &e) {
		Log::fatal("Uncaught strata::Exception instance");
		Log::fatal("what(): {}", e.what());
		auto loc = e.where();
		Log::fatal("where(): {}:{}", loc.file_name(), loc.line());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}
	catch (const std::exception &e) {
		Log::fatal("Uncaught std::exception instance");
		Log::fatal("what(): {}", e.what());
		Log::fatal("Aborting the program");
		return EXIT_FAILURE;
	}

	Log::info("Exiting normally");
	return EXIT_SUCCESS;
}
