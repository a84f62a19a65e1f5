#pragma once

#include <ctext/log.hpp>
#include <ctext/result.hpp>
#include <cstddef>
#include <string>
#include <vector>
#include <optional>

namespace ctext {

// Layered configuration: global (~/.ctext/config.toml) < local (--config)
// Command-line flags are applied on top by the caller.
struct Config {
    // [scan]
    size_t max_buffer = 0;
    // [macros]
    std::vector<std::string> macro_names;
    // [log]
    log::Level log_level = log::Info;
    bool log_color = false;

    // Track which fields were explicitly set (for merge)
    bool max_buffer_set = false;
    bool log_level_set = false;
    bool log_color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values override
    // this; macro names accumulate without duplicates)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// Discover the global config file path: ~/.ctext/config.toml
std::string global_config_path();

// Parse a non-negative byte count such as a --max-buffer value. option
// names the setting in the error message.
Result<size_t> parse_size(const std::string& s, const std::string& option);

} // namespace ctext
