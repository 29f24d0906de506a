#pragma once

#include <strata/visibility.hpp>

#include <system_error>

namespace strata
{

// This error code is supplemental to exception classes and is
// intended to be tested and reacted on by exception handling.
enum class StrataErrc : int {
	// Input data is invalid/corrupt and can't be used
	InvalidData = 1,
	// An index or coordinate lies outside of the addressed container
	OutOfRange = 2,
	// Requested file does not exist or is inaccessible
	FileNotFound = 3,
	// A config object has no requested option but user assumes it exists
	OptionMissing = 4,
	// Call to external library failed for library-specific reasons
	ExternalLibFailure = 5,
	// Error is unknown or unexpected here
	UnknownError = 6,
};

// ADL-accessible factory for `std::error_condition { StrataErrc }`
STRATA_API std::error_condition make_error_condition(StrataErrc errc) noexcept;

} // namespace strata

namespace std
{

// Mark `StrataErrc` as eligible for `std::error_condition`
template<>
struct is_error_condition_enum<strata::StrataErrc> : true_type {};

} // namespace std
