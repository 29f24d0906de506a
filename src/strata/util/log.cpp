#include <strata/util/log.hpp>

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace strata
{

Log::Level Log::m_current_level = Log::Level::Trace;

// Thread-local buffer to avoid allocations on each print. Chunk workers
// log concurrently, so sharing one buffer between threads is not an option.
static thread_local fmt::memory_buffer t_message_buffer;

static fmt::text_style styleForLevel(Log::Level level) noexcept
{
	switch (level) {
	case Log::Level::Trace:
		return fmt::fg(fmt::color::wheat);
	case Log::Level::Debug:
		return fmt::fg(fmt::color::light_sea_green);
	case Log::Level::Info:
		return fmt::fg(fmt::color::green);
	case Log::Level::Warn:
		return fmt::fg(fmt::color::yellow);
	case Log::Level::Error:
		return fmt::fg(fmt::color::red);
	case Log::Level::Fatal:
		return fmt::emphasis::bold | fmt::fg(fmt::color::white) | fmt::bg(fmt::color::red);
	case Log::Level::Off:
		break;
	} // No `default` to make `-Werror -Wswitch` protection work

	return {};
}

void Log::doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept
{
	std::string_view text;

	try {
		auto &msgbuf = t_message_buffer;

		try {
			msgbuf.clear();
			fmt::vformat_to(std::back_inserter(msgbuf), format_str, format_args);
		}
		catch (const fmt::format_error &err) {
			// Bad format string is a bug at the call site, make it visible
			level = std::max(level, Level::Error);
			msgbuf.clear();
			fmt::format_to(std::back_inserter(msgbuf), "Caught fmt::format_error when trying to log: {}", err.what());
		}

		text = { msgbuf.data(), msgbuf.size() };
	}
	catch (const std::exception &) {
		// Reaching here means the failure message itself could not be formatted (out of memory).
		// Nothing potentially-throwing is allowed anymore, just use a literal.
		level = std::max(level, Level::Error);
		text = "Caught exception when trying to format log message";
	}

	const auto pid = getpid();
	const auto tid = gettid();

	try {
		// stdout for `X <= Info`, stderr for `X >= Warn`
		FILE *sink = stdout;
		if (level >= Level::Warn) {
			// Flush `stdout` to not mess the messages when it's directed to same output as `stderr`
			fflush(stdout);
			sink = stderr;
		}

		fmt::print(sink, "[{:%F %T}][{} {}][{:s}:{:d}][{:s}] {:s}\n", std::chrono::system_clock::now(), pid, tid,
			where.file_name(), where.line(), fmt::styled(extras::enum_name(level), styleForLevel(level)), text);
	}
	catch (const std::system_error &err) {
		// Printing to `sink` failed for system reasons, try plain stdio once more
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] std::system_error when printing log: %s:%d (%s)\n",
			pid, tid, where.file_name(), where.line(), err.code().category().name(), err.code().value(), err.what());
	}
	catch (const std::exception &err) {
		fflush(stdout);
		fprintf(stderr, "[XXXX-XX-XX XX:XX:XX][%d %d][%s:%u][ERROR] Exception when printing log: %s\n", pid, tid,
			where.file_name(), where.line(), err.what());
	}
}

void Log::setLevel(Level level) noexcept
{
	m_current_level = level;
	info("Changing log level to [{}]", extras::enum_name(level));
}

Log::Level Log::levelFromString(std::string_view name, Level fallback) noexcept
{
	constexpr Level ALL_LEVELS[] = { Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Fatal,
		Level::Off };

	for (Level candidate : ALL_LEVELS) {
		std::string_view candidate_name = extras::enum_name(candidate);
		bool equal = std::equal(name.begin(), name.end(), candidate_name.begin(), candidate_name.end(),
			[](char a, char b) { return std::toupper(static_cast<unsigned char>(a)) == b; });

		if (equal) {
			return candidate;
		}
	}

	return fallback;
}

} // namespace strata

namespace extras
{

using strata::Log;

template<>
std::string_view enum_name(Log::Level value) noexcept
{
	using namespace std::string_view_literals;

	switch (value) {
	case Log::Level::Trace:
		return "TRACE"sv;
	case Log::Level::Debug:
		return "DEBUG"sv;
	case Log::Level::Info:
		return "INFO"sv;
	case Log::Level::Warn:
		return "WARN"sv;
	case Log::Level::Error:
		return "ERROR"sv;
	case Log::Level::Fatal:
		return "FATAL"sv;
	case Log::Level::Off:
		return "OFF"sv;
	} // No `default` to make `-Werror -Wswitch` protection work

	return "UNKNOWN"sv;
}

} // namespace extras
