// demo_items.cpp
//
// Lex and parse an item file with the illustrative item grammar, then print
// the parse tree or the formatted error.
//
//     ./demo_items file.items                   # tree
//     ./demo_items file.items --tokens          # tokens, then tree
//     ./demo_items file.items --config pc.toml  # layer a local config
//
// ~/.pcomb/config.toml is picked up automatically when present.

#include <pcomb/config.hpp>
#include <pcomb/dump.hpp>
#include <pcomb/engine.hpp>
#include <pcomb/lang/grammar.hpp>
#include <pcomb/lang/lexer.hpp>
#include <pcomb/log.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace pcomb;

static std::optional<Config> load_optional(const std::string& path) {
    if (path.empty() || !std::filesystem::exists(path)) return std::nullopt;
    auto r = Config::load(path);
    if (r.is_err()) {
        log::warn("ignoring config: %s", r.error().format().c_str());
        return std::nullopt;
    }
    return std::move(r).value();
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: demo_items <file> [--tokens] [--config <file.toml>]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_tokens = false;
    std::string local_config;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--tokens") {
            show_tokens = true;
        } else if (arg == "--config" && i + 1 < argc) {
            local_config = argv[++i];
        } else {
            std::cerr << "error: unknown argument " << arg << "\n";
            return 1;
        }
    }

    Config cfg = Config::effective(load_optional(global_config_path()),
                                   load_optional(local_config));
    cfg.apply_logging();

    std::ifstream f(path);
    if (!f) {
        std::cerr << PcombError{PcombError::IO, "cannot open " + path}.format() << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    // Lex
    auto lr = lex_items(ss.str(), path);
    if (lr.is_err()) {
        std::cerr << lr.error().format() << "\n";
        return 1;
    }
    const auto& tokens = lr.value();
    log::info("%s: %zu tokens", path.c_str(), tokens.size());

    if (show_tokens) {
        std::cout << "-- Tokens --\n";
        for (const auto& t : tokens) {
            std::cout << "  " << t.span << "  " << describe(t.type) << "\n";
        }
        std::cout << "\n";
    }

    // Parse
    auto grammar = make_item_grammar();
    auto pr = parse_tokens(*grammar, tokens, cfg.options, path);
    if (pr.is_err()) {
        std::cerr << pr.error().format() << "\n";
        return 2;
    }

    std::cout << "-- Tree (" << count_tokens(pr.value()) << " tokens) --\n";
    dump_to(std::cout, pr.value(), describe);
    return 0;
}
