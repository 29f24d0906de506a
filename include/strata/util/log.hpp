#pragma once

#include <strata/visibility.hpp>

#include <extras/enum_utils.hpp>

#include <fmt/core.h>

#include <source_location>
#include <string_view>
#include <type_traits>

namespace strata
{

class STRATA_API Log {
public:
	using Location = std::source_location;

	// Log levels are defined by increasing severity - it's valid to compare them as integers
	enum class Level : int {
		/* Implementation details of some specific action (e.g. per-column values inside a chunk pass).
		 * Should generally not be left in production code paths, it clutters the log heavily. */
		Trace,
		/* Low-level program workflow (e.g. entering/exiting a specific function or generating one chunk). */
		Debug,
		/* High-level program workflow (e.g. starting a batch of chunks, changing the seed). */
		Info,
		/* An error happened, but the current action can still be completed with some negative impact. */
		Warn,
		/* An error happened which makes completing the current action impossible
		 * (e.g. a chunk pass received malformed surface indices) but does not require program termination. */
		Error,
		/* An error happened which makes further program execution impossible. In most cases
		 * this implies a bug in the code or a broken environment. */
		Fatal,

		Off // Not actually a logging level, use it with `setLevel` to disable logging completely
	};

	// Format string bundled with the location of the call site.
	// Implicitly constructible from anything convertible to `std::string_view`,
	// so `Log::info("text {}", value)` captures the caller location automatically.
	struct FormatString {
		template<typename S>
			requires std::is_convertible_v<const S &, std::string_view>
		FormatString(const S &str, Location loc = Location::current()) noexcept : format(str), where(loc)
		{}

		FormatString(std::string_view str, Location loc) noexcept : format(str), where(loc) {}

		std::string_view format;
		Location where;
	};

	template<typename... Args>
	static void log(Level level, Location where, std::string_view format_str, Args &&...args) noexcept
	{
		if (!willBeLogged(level)) {
			return;
		}
		doLog(level, where, format_str, fmt::make_format_args(args...));
	}

	template<typename... Args>
	static void trace(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Trace, fs.where, fs.format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void debug(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Debug, fs.where, fs.format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void info(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Info, fs.where, fs.format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void warn(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Warn, fs.where, fs.format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void error(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Error, fs.where, fs.format, std::forward<Args>(args)...);
	}

	template<typename... Args>
	static void fatal(FormatString fs, Args &&...args) noexcept
	{
		log(Level::Fatal, fs.where, fs.format, std::forward<Args>(args)...);
	}

	// Returns the current logging level.
	// Initially it is set to `Trace` regardless of build type (i.e. everything is logged).
	static Level level() noexcept { return m_current_level; }
	// Changes the current logging level
	static void setLevel(Level level) noexcept;
	// Returns whether logging with the given level will ultimately output something
	static bool willBeLogged(Level level) noexcept { return level >= m_current_level; }

	// Parse level name as printed in log lines (case-insensitive), returns `fallback` on failure
	static Level levelFromString(std::string_view name, Level fallback) noexcept;

private:
	Log() = delete;

	static Level m_current_level;

	static void doLog(Level level, Location where, std::string_view format_str, fmt::format_args format_args) noexcept;
};

} // namespace strata

namespace extras
{

template<>
STRATA_API std::string_view enum_name(strata::Log::Level value) noexcept;

}
