#pragma once

#include <pcomb/log.hpp>
#include <pcomb/parse.hpp>
#include <pcomb/result.hpp>
#include <string>
#include <vector>

namespace pcomb {

struct ParseOptions {
    size_t max_tokens = 0;          // 0 = unlimited
    bool require_complete = false;  // every token must be consumed
};

inline const char* outcome_name(Outcome o) {
    switch (o) {
    case Outcome::None: return "none";
    case Outcome::Ok:   return "ok";
    case Outcome::Err:  return "err";
    }
    return "unknown";
}

// Run root over tokens from offset 0 and lift the outcome into a Result.
// A root-level None is an empty match and yields an empty Nested tree.
template<typename T>
Result<ParseData<T>> parse_tokens(const Parser<T>& root,
                                  const std::vector<Token<T>>& tokens,
                                  const ParseOptions& options = {},
                                  const std::string& file = "") {
    if (options.max_tokens != 0 && tokens.size() > options.max_tokens) {
        return PcombError{PcombError::Limit,
            "input has " + std::to_string(tokens.size()) +
                " tokens, limit is " + std::to_string(options.max_tokens),
            "raise [parse] max-tokens or set it to 0 for no limit",
            file, 0};
    }

    Context<T> ctx(tokens);
    Parse<T> parse = root.parse(ctx, 0);

    log::trace("%s: outcome %s over [%zu, %zu)", parse.type_parsed.c_str(),
               outcome_name(parse.data.outcome()),
               parse.start_offset, parse.end_offset);

    if (parse.data.is_err()) {
        return std::move(parse.data).error().to_error(file);
    }

    if (options.require_complete && parse.end_offset < tokens.size()) {
        return ParseError(root.label(), ctx.span_at(parse.end_offset),
                          ParseError::UnconsumedInput).to_error(file);
    }

    log::debug("%s: consumed %zu of %zu tokens", root.label().c_str(),
               parse.end_offset, tokens.size());

    if (parse.data.is_none()) {
        return Result<ParseData<T>>::ok(ParseData<T>::from_nested({}));
    }
    return Result<ParseData<T>>::ok(std::move(parse.data).value());
}

} // namespace pcomb
