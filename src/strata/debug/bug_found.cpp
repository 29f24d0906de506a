#include <strata/debug/bug_found.hpp>

#include <strata/util/log.hpp>

#include <cstdlib>

#ifndef _WIN32
	#define BACKWARD_HAS_DW 1
#endif

#include <backward.hpp>

namespace strata::debug
{

void bugFound(std::string_view message, std::source_location where)
{
	Log::log(Log::Level::Fatal, where, "----[ BUG FOUND ]----");
	Log::log(Log::Level::Fatal, where, "Please report this log output along with world seed and chunk coordinates.");
	Log::log(Log::Level::Fatal, where, "Explanation message: {}", message);

	backward::StackTrace st;
	st.load_here();

	backward::Printer pr;
	pr.snippet = false;
	pr.color_mode = backward::ColorMode::automatic;
	pr.address = true;
	pr.object = true;
	pr.reverse = false;
	pr.print(st);

	Log::fatal("----[ ABORTING STRATA ]----");
	std::abort();
}

} // namespace strata::debug
