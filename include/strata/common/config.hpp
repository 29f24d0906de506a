#pragma once

#include <strata/visibility.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#define SI_CONVERT_GENERIC
#include <SimpleIni.h>

namespace strata
{

// INI-backed typed configuration. Every option is declared by a scheme entry
// whose default value also fixes the option type. Options missing from the
// file get default values (and are written back with description on `save()`).
class STRATA_API Config {
public:
	using Location = std::source_location;
	using option_t = std::variant<std::string, int64_t, double, bool>;

	struct SchemeEntry {
		std::string section;
		std::string parameter_name;
		std::string description;
		option_t default_value;
	};
	using Scheme = std::vector<SchemeEntry>;

	// Missing file is not an error, all options take default values then.
	// Throws `Exception` with `StrataErrc::InvalidData` if some value in the file
	// can't be parsed as the type of its scheme entry.
	Config(std::filesystem::path config_filepath, Scheme scheme);
	Config(Config &&) = delete;
	Config(const Config &) = delete;
	Config &operator=(Config &&) = delete;
	Config &operator=(const Config &) = delete;
	~Config() noexcept;

	// Replace value of existing option with `value_string` parsed as its type.
	// If `save_to_config_file` is true the new value will also be written on `save()`.
	// Throws `Exception` with `StrataErrc::OptionMissing` if there is no such
	// option and with `StrataErrc::InvalidData` if the value can't be parsed.
	void patch(std::string_view section, std::string_view parameter_name, std::string_view value_string,
		bool save_to_config_file = false, Location loc = Location::current());

	// Write current state into the config file, creating parent directories if needed.
	// Throws `Exception` with `StrataErrc::FileNotFound` if the file can't be written.
	void save() const;

	std::optional<std::string> optionString(std::string_view section, std::string_view parameter_name) const;
	std::optional<int64_t> optionInt64(std::string_view section, std::string_view parameter_name) const;
	// Throws `Exception` with `StrataErrc::InvalidData` if the value does not fit into 32 bits
	std::optional<int32_t> optionInt32(std::string_view section, std::string_view parameter_name) const;
	std::optional<double> optionDouble(std::string_view section, std::string_view parameter_name) const;
	std::optional<bool> optionBool(std::string_view section, std::string_view parameter_name) const;

	// These throw `Exception` with `StrataErrc::OptionMissing` if there is no such option
	int32_t getInt32(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	double getDouble(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;
	bool getBool(std::string_view section, std::string_view parameter_name, Location loc = Location::current()) const;
	std::string getString(std::string_view section, std::string_view parameter_name,
		Location loc = Location::current()) const;

	const std::filesystem::path &path() const noexcept { return m_path; }

public:
	// Scheme of `strata_landgen` configuration
	static Scheme mainConfigScheme();

	static std::string optionToString(const option_t &value);

	// Throws `Exception` with `StrataErrc::InvalidData` if `s` is not a valid value of the given type
	static option_t optionFromString(std::string_view s, size_t type);

private:
	std::map<std::string, std::map<std::string, option_t, std::less<>>, std::less<>> m_data;
	std::filesystem::path m_path;
	mutable CSimpleIniA m_ini;

	const option_t *findOption(std::string_view section, std::string_view parameter_name) const noexcept;
};

} // namespace strata
