#pragma once

#include <strata/visibility.hpp>

#include <exception>
#include <source_location>
#include <string>
#include <system_error>

namespace strata
{

// Base exception class for all exceptions thrown by Strata.
// Subsystems should not subclass it unless there is valuable additional
// information to carry; reacting on the error kind is done by comparing
// `error()` against `StrataErrc` or `std::errc` values.
//
// Throwing is slow and this object is not cheap to construct either, so it is
// reserved for truly exceptional results. Land generation throws it only on
// contract violations by the caller, which invalidate the whole chunk.
class STRATA_API Exception : public std::exception {
public:
	using Location = std::source_location;

	Exception() = delete;
	Exception(Exception &&) = default;
	Exception(const Exception &) = default;
	Exception &operator=(Exception &&) = default;
	Exception &operator=(const Exception &) = default;
	~Exception() override;

	const char *what() const noexcept override { return m_what.c_str(); }
	const std::error_condition &error() const noexcept { return m_error; }
	// Source location where the exception was thrown.
	// Pass it to `Log::log` to make logs appear as if they were made in that location.
	const Location &where() const noexcept { return m_where; }

	// Construct exception from `std::error_code`. Use this when directly
	// wrapping error code returned from an external library/platform call.
	//
	// `what()` string will be formatted like this:
	// "<details> (code [<ec.category>:<ec>] <ec.message>)"
	static Exception fromErrorCode(std::error_code ec, const char *details, Location loc = Location::current());

	// Construct exception from `std::error_condition`.
	// Generally you should use this form and combine it with `StrataErrc` or `std::errc`.
	//
	// `what()` string will be formatted like this:
	// "<details> (cond [<ec.category>:<ec>] <ec.message>)"
	static Exception fromError(std::error_condition ec, const char *details, Location loc = Location::current());

protected:
	Exception(std::string what, std::error_condition error, Location loc);

private:
	std::string m_what;
	std::error_condition m_error;
	Location m_where;
};

} // namespace strata
