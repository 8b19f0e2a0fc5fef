#include <pcomb/config.hpp>
#include <tomlplusplus/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace pcomb {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PcombError{PcombError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) {
                return PcombError{PcombError::Config,
                    lvl.error().message, lvl.error().hint};
            }
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto v = (*lg)["color"].value<bool>()) {
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [parse] section
    if (auto ps = doc["parse"].as_table()) {
        if (auto v = (*ps)["max-tokens"].value<int64_t>()) {
            if (*v < 0) {
                return PcombError{PcombError::Config,
                    "[parse] max-tokens must not be negative",
                    "use 0 for no limit"};
            }
            cfg.options.max_tokens = static_cast<size_t>(*v);
            cfg.max_tokens_set = true;
        }
        if (auto v = (*ps)["require-complete"].value<bool>()) {
            cfg.options.require_complete = *v;
            cfg.require_complete_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PcombError{PcombError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).map_err([&](PcombError e) {
        if (e.file.empty()) e.file = path;
        return e;
    });
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.max_tokens_set) {
        options.max_tokens = other.options.max_tokens;
        max_tokens_set = true;
    }
    if (other.require_complete_set) {
        options.require_complete = other.options.require_complete;
        require_complete_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) {
        log::set_color_enabled(log_color);
    }
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pcomb/config.toml";
}

} // namespace pcomb
