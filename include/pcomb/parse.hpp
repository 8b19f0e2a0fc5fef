#pragma once

#include <pcomb/error.hpp>
#include <pcomb/token.hpp>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pcomb {

// ---------------------------------------------------------------------------
// Errors
// ---------------------------------------------------------------------------

struct ParseError {
    static constexpr const char* SyntaxError = "Syntax error";
    static constexpr const char* UnexpectedEnd = "Unexpected end of input";
    static constexpr const char* UnconsumedInput = "Unconsumed input";
    static constexpr const char* EmptyMatch = "Internal error: empty match";

    std::string expected;   // label of the rule that failed
    Span span;
    const char* message = SyntaxError;

    ParseError() = default;
    ParseError(std::string exp, Span sp, const char* msg = SyntaxError)
        : expected(std::move(exp)), span(sp), message(msg) {}

    // "expected <label> at <line>:<cs>-<ce>: <message>"
    std::string format() const;

    // Lift into the library error type for callers outside the engine
    PcombError to_error(const std::string& file = "") const;
};

// ---------------------------------------------------------------------------
// Parse tree payload
// ---------------------------------------------------------------------------

enum class DataKind {
    Nested,
    TokenList,
    Token
};

template<typename T>
class ParseData {
public:
    using NestedList = std::vector<ParseData<T>>;
    using TokenList = std::vector<Token<T>>;

    static ParseData from_nested(NestedList items) {
        return ParseData(Value(std::in_place_index<0>, std::move(items)));
    }
    static ParseData from_tokens(TokenList tokens) {
        return ParseData(Value(std::in_place_index<1>, std::move(tokens)));
    }
    static ParseData from_token(Token<T> tok) {
        return ParseData(Value(std::in_place_index<2>, std::move(tok)));
    }

    DataKind kind() const { return static_cast<DataKind>(value_.index()); }
    bool is_nested() const { return kind() == DataKind::Nested; }
    bool is_token_list() const { return kind() == DataKind::TokenList; }
    bool is_token() const { return kind() == DataKind::Token; }

    const NestedList& nested() const { return std::get<0>(value_); }
    const TokenList& tokens() const { return std::get<1>(value_); }
    const Token<T>& token() const { return std::get<2>(value_); }

    // Logical items this node represents: one for a token, the element
    // count for either list form.
    size_t item_count() const {
        switch (kind()) {
        case DataKind::Nested:    return nested().size();
        case DataKind::TokenList: return tokens().size();
        case DataKind::Token:     return 1;
        }
        return 0;
    }

    // Span of the leftmost token in the tree, or nullopt when the tree
    // holds no token at all (an empty list anywhere on the left spine).
    std::optional<Span> first_span() const {
        switch (kind()) {
        case DataKind::Token:
            return token().span;
        case DataKind::TokenList:
            if (tokens().empty()) return std::nullopt;
            return tokens().front().span;
        case DataKind::Nested:
            if (nested().empty()) return std::nullopt;
            return nested().front().first_span();
        }
        return std::nullopt;
    }

private:
    using Value = std::variant<NestedList, TokenList, Token<T>>;

    explicit ParseData(Value v) : value_(std::move(v)) {}

    Value value_;
};

// ---------------------------------------------------------------------------
// Tri-state outcome
// ---------------------------------------------------------------------------

enum class Outcome {
    None,   // optional rule legitimately matched nothing
    Ok,
    Err
};

template<typename T>
class ParseResult {
    std::variant<std::monostate, ParseData<T>, ParseError> data_;

public:
    ParseResult() = default;

    static ParseResult ok(ParseData<T> data) {
        ParseResult r;
        r.data_.template emplace<1>(std::move(data));
        return r;
    }
    static ParseResult err(ParseError e) {
        ParseResult r;
        r.data_.template emplace<2>(std::move(e));
        return r;
    }
    static ParseResult none() { return ParseResult(); }

    Outcome outcome() const { return static_cast<Outcome>(data_.index()); }
    bool is_ok() const { return data_.index() == 1; }
    bool is_err() const { return data_.index() == 2; }
    bool is_none() const { return data_.index() == 0; }

    ParseData<T>& value() & { return std::get<1>(data_); }
    const ParseData<T>& value() const& { return std::get<1>(data_); }
    ParseData<T>&& value() && { return std::get<1>(std::move(data_)); }

    ParseError& error() & { return std::get<2>(data_); }
    const ParseError& error() const& { return std::get<2>(data_); }
    ParseError&& error() && { return std::get<2>(std::move(data_)); }
};

// Full outcome of one combinator invocation. size() is the number of
// token positions covered by [start_offset, end_offset).
template<typename T>
struct Parse {
    std::string type_parsed;
    ParseResult<T> data;
    size_t start_offset = 0;
    size_t end_offset = 0;

    size_t size() const { return end_offset - start_offset; }
};

// ---------------------------------------------------------------------------
// Context
// ---------------------------------------------------------------------------

// Result of Context::get_required. When token is null, miss holds the
// outcome the caller should report (None if optional, else end-of-input).
template<typename T>
struct TokenLookup {
    const Token<T>* token = nullptr;
    ParseResult<T> miss;

    explicit operator bool() const { return token != nullptr; }
};

// Read-only view over the token sequence of a single parse call. The
// tokens must outlive the context.
template<typename T>
class Context {
public:
    explicit Context(const std::vector<Token<T>>& tokens)
        : tokens_(tokens.data()), size_(tokens.size()) {}
    Context(const Token<T>* tokens, size_t count)
        : tokens_(tokens), size_(count) {}

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    const Token<T>* get(size_t index) const {
        return index < size_ ? &tokens_[index] : nullptr;
    }

    TokenLookup<T> get_required(const std::string& label, size_t index,
                                bool optional) const {
        TokenLookup<T> lookup;
        lookup.token = get(index);
        if (!lookup.token && !optional) {
            lookup.miss = ParseResult<T>::err(
                ParseError(label, span_last(), ParseError::UnexpectedEnd));
        }
        return lookup;
    }

    // Span of the last token, or the default span for empty input
    Span span_last() const {
        return empty() ? Span() : tokens_[size_ - 1].span;
    }

    // Span of the token at index, falling back to span_last() past the end
    Span span_at(size_t index) const {
        const Token<T>* tok = get(index);
        return tok ? tok->span : span_last();
    }

private:
    const Token<T>* tokens_;
    size_t size_;
};

// ---------------------------------------------------------------------------
// Parser capability
// ---------------------------------------------------------------------------

// Every combinator implements parse(). Implementations must not keep
// state between calls: a grammar is built once and reused.
template<typename T>
class Parser {
public:
    Parser(std::string label, bool optional)
        : label_(std::move(label)), optional_(optional) {}
    virtual ~Parser() = default;

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    // The returned Parse always has start_offset == offset.
    virtual Parse<T> parse(const Context<T>& ctx, size_t offset) const = 0;

    const std::string& label() const { return label_; }
    bool optional() const { return optional_; }

protected:
    Parse<T> make(ParseResult<T> result, size_t start, size_t end) const {
        return Parse<T>{label_, std::move(result), start, end};
    }

    Parse<T> none(size_t start, size_t end) const {
        return make(ParseResult<T>::none(), start, end);
    }

    Parse<T> fail(const Span& span, size_t start, size_t end,
                  const char* message = ParseError::SyntaxError) const {
        return make(ParseResult<T>::err(ParseError(label_, span, message)),
                    start, end);
    }

private:
    std::string label_;
    bool optional_;
};

template<typename T>
using ParserPtr = std::unique_ptr<Parser<T>>;

template<typename T>
using ParserList = std::vector<ParserPtr<T>>;

} // namespace pcomb
