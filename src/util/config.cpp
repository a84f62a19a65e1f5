#include <ctext/config.hpp>
#include <toml++/toml.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace ctext {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return CtextError{CtextError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [scan] section
    if (auto scan = doc["scan"].as_table()) {
        if (auto v = (*scan)["max-buffer"].value<int64_t>()) {
            if (*v < 0) {
                return CtextError{CtextError::Config,
                    "[scan] max-buffer must not be negative",
                    "use 0 for an unlimited buffer"};
            }
            cfg.max_buffer = static_cast<size_t>(*v);
            cfg.max_buffer_set = true;
        }
    }

    // [macros] section
    if (auto macros = doc["macros"].as_table()) {
        if (auto names = (*macros)["names"].as_array()) {
            for (const auto& n : *names) {
                auto s = n.value<std::string>();
                if (!s) {
                    return CtextError{CtextError::Config,
                        "[macros] names must be an array of strings"};
                }
                cfg.macro_names.push_back(*s);
            }
        }
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            if (!log::parse_level(*v, cfg.log_level)) {
                return CtextError{CtextError::Config,
                    "unknown log level '" + *v + "'",
                    "expected one of: trace, debug, info, warn, error"};
            }
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return CtextError{CtextError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).with_location(path);
}

void Config::merge(const Config& other) {
    if (other.max_buffer_set) {
        max_buffer = other.max_buffer;
        max_buffer_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }

    for (const auto& n : other.macro_names) {
        if (std::find(macro_names.begin(), macro_names.end(), n) == macro_names.end()) {
            macro_names.push_back(n);
        }
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

Result<size_t> parse_size(const std::string& s, const std::string& option) {
    if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
        return CtextError{CtextError::InvalidArg,
            "invalid " + option + " value '" + s + "'",
            "expected a non-negative number of bytes"};
    }
    unsigned long long n = 0;
    try {
        n = std::stoull(s);
    } catch (const std::out_of_range&) {
        return CtextError{CtextError::InvalidArg,
            "invalid " + option + " value '" + s + "'",
            "value is out of range"};
    }
    if (n > std::numeric_limits<size_t>::max()) {
        return CtextError{CtextError::InvalidArg,
            "invalid " + option + " value '" + s + "'",
            "value is out of range"};
    }
    return Result<size_t>::ok(static_cast<size_t>(n));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ctext/config.toml";
}

} // namespace ctext
