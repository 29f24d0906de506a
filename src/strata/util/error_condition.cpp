#include <strata/util/error_condition.hpp>

#include <string>

namespace strata
{

namespace
{

struct StrataErrorCategory : std::error_category {
	const char *name() const noexcept override { return "Strata error"; }

	std::string message(int code) const override
	{
		switch (static_cast<StrataErrc>(code)) {
		case StrataErrc::InvalidData: return "Input data is invalid/corrupt and can't be used";
		case StrataErrc::OutOfRange: return "Index or coordinate lies outside of the addressed container";
		case StrataErrc::FileNotFound: return "Requested file does not exist or is inaccessible";
		case StrataErrc::OptionMissing: return "A config object has no requested option but user assumes it exists";
		case StrataErrc::ExternalLibFailure: return "Call to external library failed for library-specific reasons";
		case StrataErrc::UnknownError: return "Error is unknown or unexpected here";
		// No `default` to make `-Werror -Wswitch` protection work
		}

		return "Unknown error";
	}
};

const StrataErrorCategory g_category;

} // anonymous namespace

std::error_condition make_error_condition(StrataErrc errc) noexcept
{
	return { static_cast<int>(errc), g_category };
}

} // namespace strata
