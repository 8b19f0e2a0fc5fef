#pragma once

#include <pcomb/engine.hpp>
#include <pcomb/log.hpp>
#include <pcomb/result.hpp>
#include <optional>
#include <string>

namespace pcomb {

// Layered configuration: global (~/.pcomb/config.toml) then local.
// Only fields a layer sets explicitly override the layer below it.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    ParseOptions options;

    bool log_level_set = false;
    bool log_color_set = false;
    bool max_tokens_set = false;
    bool require_complete_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push [log] settings into pcomb::log. Color is left to tty
    // detection unless the config sets it.
    void apply_logging() const;
};

// Discover the global config file path: ~/.pcomb/config.toml
std::string global_config_path();

} // namespace pcomb
