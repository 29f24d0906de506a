#pragma once

#include <strata/visibility.hpp>

#include <source_location>
#include <string_view>

namespace strata::debug
{

// Call when an internal invariant is broken in a way that can't be caused
// by caller input, e.g. an out-of-enum value reaching an exhaustive switch.
//
// Prints log message with stacktrace and explanatory message,
// requests user to create a bugreport and then calls `abort()`.
[[noreturn]] STRATA_API void bugFound(std::string_view message = "",
	std::source_location where = std::source_location::current());

} // namespace strata::debug
