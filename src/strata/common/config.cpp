#include <strata/common/config.hpp>

#include <strata/land/land_public_consts.hpp>
#include <strata/util/error_condition.hpp>
#include <strata/util/exception.hpp>
#include <strata/util/log.hpp>

#include <cctype>
#include <limits>
#include <stdexcept>
#include <system_error>

using namespace std::filesystem;
using std::string_view;

namespace strata
{

namespace
{

template<typename T>
std::optional<T> getTyped(const Config::option_t *value)
{
	if (!value) {
		return std::nullopt;
	}

	if (const T *typed = std::get_if<T>(value); typed) {
		return *typed;
	}

	Log::error("Config option type mismatch: requested alternative {}, stored alternative {}",
		Config::option_t(T {}).index(), value->index());
	throw Exception::fromError(StrataErrc::InvalidData, "config option requested with wrong type");
}

} // namespace

Config::Config(path path, Config::Scheme scheme) : m_path(std::move(path))
{
	m_ini.SetUnicode();

	std::string filepath = m_path.string();
	if (SI_Error err = m_ini.LoadFile(filepath.c_str()); err < 0) {
		// Missing file is expected on the first run
		Log::info("Can't load config file '{}' (error {}), using default values", filepath, int(err));
	}

	for (const SchemeEntry &entry : scheme) {
		option_t value;
		const char *value_ptr = m_ini.GetValue(entry.section.c_str(), entry.parameter_name.c_str());
		if (!value_ptr) {
			const std::string value_str = optionToString(entry.default_value);
			// Works only for one-line descriptions. For multiline, each new line must start with '; '
			const std::string comment = "; " + entry.description;
			m_ini.SetValue(entry.section.c_str(), entry.parameter_name.c_str(), value_str.c_str(), comment.c_str());
			value = entry.default_value;
		} else {
			size_t type = entry.default_value.index();

			try {
				value = Config::optionFromString(string_view(value_ptr), type);
			}
			catch (const Exception &) {
				Log::error("Bad value '{}' of option {}/{} in config file '{}'", value_ptr, entry.section,
					entry.parameter_name, filepath);
				throw;
			}
		}

		m_data[entry.section][entry.parameter_name] = std::move(value);
	}
}

Config::~Config() noexcept = default;

void Config::save() const
{
	std::error_code ec;
	if (m_path.has_parent_path()) {
		create_directories(m_path.parent_path(), ec);
		if (ec) {
			Log::error("Can't create directories for config file '{}'", m_path.string());
			throw Exception::fromErrorCode(ec, "failed to create config file directory");
		}
	}

	if (SI_Error err = m_ini.SaveFile(m_path.string().c_str()); err < 0) {
		Log::error("Can't save config file '{}' (error {})", m_path.string(), int(err));
		throw Exception::fromError(StrataErrc::FileNotFound, "failed to save config file");
	}

	Log::info("Config saved to '{}'", m_path.string());
}

Config::Scheme Config::mainConfigScheme()
{
	Config::Scheme s;

	s.push_back({ "world", "seed", "World generation seed (32-bit signed integer)",
		int64_t(land::Consts::DEFAULT_WORLD_SEED) });
	s.push_back({ "landgen", "threads", "Number of chunk generation threads (0 to auto-select)", int64_t(0) });
	s.push_back({ "log", "level", "Minimal logged message level (trace/debug/info/warn/error/fatal/off)",
		std::string("info") });

	return s;
}

const Config::option_t *Config::findOption(string_view section, string_view parameter_name) const noexcept
{
	auto it_ext = m_data.find(section);
	if (it_ext != m_data.end()) {
		auto it_inter = it_ext->second.find(parameter_name);
		if (it_inter != it_ext->second.end()) {
			return &it_inter->second;
		}
	}

	return nullptr;
}

std::optional<bool> Config::optionBool(string_view section, string_view parameter_name) const
{
	return getTyped<bool>(findOption(section, parameter_name));
}

std::optional<double> Config::optionDouble(string_view section, string_view parameter_name) const
{
	return getTyped<double>(findOption(section, parameter_name));
}

std::optional<int64_t> Config::optionInt64(string_view section, string_view parameter_name) const
{
	return getTyped<int64_t>(findOption(section, parameter_name));
}

std::optional<int32_t> Config::optionInt32(string_view section, string_view parameter_name) const
{
	std::optional<int64_t> opt = optionInt64(section, parameter_name);
	if (!opt.has_value()) {
		return std::nullopt;
	}

	int64_t value = *opt;
	if (value < std::numeric_limits<int32_t>::min() || value > std::numeric_limits<int32_t>::max()) {
		Log::error("Option {}/{} value {} does not fit into int32", section, parameter_name, value);
		throw Exception::fromError(StrataErrc::InvalidData, "config option value out of int32 range");
	}

	return static_cast<int32_t>(value);
}

std::optional<std::string> Config::optionString(string_view section, string_view parameter_name) const
{
	return getTyped<std::string>(findOption(section, parameter_name));
}

int32_t Config::getInt32(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionInt32(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (int32) not found", section, parameter_name);
	throw Exception::fromError(StrataErrc::OptionMissing, "missing config option assumed existing", loc);
}

double Config::getDouble(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionDouble(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (double) not found", section, parameter_name);
	throw Exception::fromError(StrataErrc::OptionMissing, "missing config option assumed existing", loc);
}

bool Config::getBool(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionBool(section, parameter_name); opt.has_value()) {
		return *opt;
	}

	Log::error("Option {}/{} (bool) not found", section, parameter_name);
	throw Exception::fromError(StrataErrc::OptionMissing, "missing config option assumed existing", loc);
}

std::string Config::getString(string_view section, string_view parameter_name, Location loc) const
{
	if (auto opt = optionString(section, parameter_name); opt.has_value()) {
		return std::move(*opt);
	}

	Log::error("Option {}/{} (string) not found", section, parameter_name);
	throw Exception::fromError(StrataErrc::OptionMissing, "missing config option assumed existing", loc);
}

void Config::patch(string_view section, string_view parameter_name, string_view value_string,
	bool save_to_config_file, Location loc)
{
	if (auto it_ext = m_data.find(section); it_ext != m_data.end()) {
		if (auto it_inter = it_ext->second.find(parameter_name); it_inter != it_ext->second.end()) {
			it_inter->second = optionFromString(value_string, it_inter->second.index());

			if (save_to_config_file) {
				const std::string str = Config::optionToString(it_inter->second);
				m_ini.SetValue(it_ext->first.c_str(), it_inter->first.c_str(), str.c_str());
			}

			return;
		}
	}

	Log::error("Option {}/{} not found for patching", section, parameter_name);
	throw Exception::fromError(StrataErrc::OptionMissing, "missing config option for patching", loc);
}

std::string Config::optionToString(const option_t &value)
{
	using namespace std;

	size_t type_idx = value.index();
	switch (type_idx) {
	case 0:
		static_assert(is_same_v<string, variant_alternative_t<0, Config::option_t>>);
		return get<string>(value);

	case 1:
		static_assert(is_same_v<int64_t, variant_alternative_t<1, Config::option_t>>);
		return to_string(get<int64_t>(value));

	case 2:
		static_assert(is_same_v<double, variant_alternative_t<2, Config::option_t>>);
		return to_string(get<double>(value));

	case 3:
		static_assert(is_same_v<bool, variant_alternative_t<3, Config::option_t>>);
		return get<bool>(value) ? "true" : "false";

	default:
		static_assert(std::variant_size_v<Config::option_t> == 4);
		return "";
	}
}

Config::option_t Config::optionFromString(string_view s, size_t type)
{
	// `std::sto*` need null-terminated input
	const std::string str(s);
	size_t parsed_chars = 0;

	try {
		switch (type) {
		case 0:
			static_assert(std::is_same_v<std::string, std::variant_alternative_t<0, Config::option_t>>);
			return str;

		case 1: {
			static_assert(std::is_same_v<int64_t, std::variant_alternative_t<1, Config::option_t>>);
			int64_t value = std::stoll(str, &parsed_chars);
			if (parsed_chars == str.size()) {
				return value;
			}
			break;
		}

		case 2: {
			static_assert(std::is_same_v<double, std::variant_alternative_t<2, Config::option_t>>);
			double value = std::stod(str, &parsed_chars);
			if (parsed_chars == str.size()) {
				return value;
			}
			break;
		}

		case 3: {
			static_assert(std::is_same_v<bool, std::variant_alternative_t<3, Config::option_t>>);
			if (s.size() != 4) {
				return false;
			}
			bool is_true_str = tolower(s[0]) == 't';
			is_true_str &= tolower(s[1]) == 'r';
			is_true_str &= tolower(s[2]) == 'u';
			is_true_str &= tolower(s[3]) == 'e';
			return is_true_str;
		}

		default:
			static_assert(std::variant_size_v<Config::option_t> == 4);
			break;
		}
	}
	catch (const std::logic_error &e) {
		// `std::invalid_argument` or `std::out_of_range`
		Log::error("Can't parse config value '{}': {}", s, e.what());
		throw Exception::fromError(StrataErrc::InvalidData, "config value can't be parsed");
	}

	Log::error("Can't parse config value '{}' as option type #{}", s, type);
	throw Exception::fromError(StrataErrc::InvalidData, "config value can't be parsed");
}

} // namespace strata
