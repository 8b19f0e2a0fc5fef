#pragma once

#include <pcomb/parse.hpp>
#include <functional>
#include <optional>
#include <utility>

namespace pcomb {

// ---------------------------------------------------------------------------
// Leaf matchers
// ---------------------------------------------------------------------------

// Matches exactly one token accepted by accepts(). A match covers one
// position; a mismatch reports the offending token's span and covers none.
template<typename T>
class TokenMatcher : public Parser<T> {
public:
    using Parser<T>::Parser;

    Parse<T> parse(const Context<T>& ctx, size_t offset) const override {
        auto lookup = ctx.get_required(this->label(), offset, this->optional());
        if (!lookup) {
            return this->make(std::move(lookup.miss), offset, offset);
        }

        if (accepts(lookup.token->type)) {
            return this->make(
                ParseResult<T>::ok(ParseData<T>::from_token(*lookup.token)),
                offset, offset + 1);
        }
        return this->fail(lookup.token->span, offset, offset);
    }

protected:
    virtual bool accepts(const T& type) const = 0;
};

// Exact token type match by value equality.
template<typename T>
class OfType : public TokenMatcher<T> {
public:
    OfType(std::string label, bool optional, T type)
        : TokenMatcher<T>(std::move(label), optional), type_(std::move(type)) {}

    const T& type() const { return type_; }

protected:
    bool accepts(const T& type) const override { return type == type_; }

private:
    T type_;
};

// Token type class match, e.g. "any identifier".
template<typename T>
class Predicate : public TokenMatcher<T> {
public:
    using Test = std::function<bool(const T&)>;

    Predicate(std::string label, bool optional, Test test)
        : TokenMatcher<T>(std::move(label), optional), test_(std::move(test)) {}

protected:
    bool accepts(const T& type) const override { return test_ && test_(type); }

private:
    Test test_;
};

// ---------------------------------------------------------------------------
// Structural combinators
// ---------------------------------------------------------------------------

// Ordered conjunction. Children reporting None contribute nothing and do
// not move the cursor. The first Err aborts the sequence; an optional
// sequence downgrades it to None but still records how far it got.
template<typename T>
class Sequence : public Parser<T> {
public:
    Sequence(std::string label, bool optional, ParserList<T> children)
        : Parser<T>(std::move(label), optional), children_(std::move(children)) {}

    Parse<T> parse(const Context<T>& ctx, size_t offset) const override {
        size_t cursor = offset;
        typename ParseData<T>::NestedList items;
        items.reserve(children_.size());

        for (const auto& child : children_) {
            Parse<T> step = child->parse(ctx, cursor);

            switch (step.data.outcome()) {
            case Outcome::Ok:
                cursor += step.size();
                items.push_back(std::move(step.data).value());
                break;
            case Outcome::Err:
                if (this->optional()) {
                    return this->none(offset, cursor);
                }
                return this->make(std::move(step.data), offset, cursor);
            case Outcome::None:
                break;
            }
        }

        return this->make(
            ParseResult<T>::ok(ParseData<T>::from_nested(std::move(items))),
            offset, cursor);
    }

    size_t child_count() const { return children_.size(); }

private:
    ParserList<T> children_;
};

// Zero-or-more closure. Greedy: once at least one iteration succeeded, a
// trailing Err is discarded. The cursor advances by the logical item count
// of each match (see ParseData::item_count), and the loop stops on the
// first iteration that makes no progress.
template<typename T>
class Repeatable : public Parser<T> {
public:
    Repeatable(std::string label, bool optional, ParserPtr<T> child)
        : Parser<T>(std::move(label), optional), child_(std::move(child)) {}

    Parse<T> parse(const Context<T>& ctx, size_t offset) const override {
        size_t cursor = offset;
        typename ParseData<T>::NestedList items;
        std::optional<ParseError> tail;

        for (;;) {
            Parse<T> step = child_->parse(ctx, cursor);

            if (step.data.is_ok()) {
                size_t advance = step.data.value().item_count();
                items.push_back(std::move(step.data).value());
                if (advance == 0) break;
                cursor += advance;
                continue;
            }
            if (step.data.is_err()) {
                tail = std::move(step.data).error();
            }
            break;
        }

        if (!items.empty()) {
            return this->make(
                ParseResult<T>::ok(ParseData<T>::from_nested(std::move(items))),
                offset, cursor);
        }
        if (this->optional()) {
            return this->none(offset, cursor);
        }
        if (tail) {
            return this->make(ParseResult<T>::err(std::move(*tail)), offset, cursor);
        }
        return this->fail(ctx.span_at(cursor), offset, cursor);
    }

private:
    ParserPtr<T> child_;
};

// Negative lookahead. Zero-width: never produces data and never moves the
// cursor. A child match is an Err anchored at the leftmost matched token
// (None when optional); a child Err or None makes Not report None.
template<typename T>
class Not : public Parser<T> {
public:
    Not(std::string label, bool optional, ParserPtr<T> child)
        : Parser<T>(std::move(label), optional), child_(std::move(child)) {}

    Parse<T> parse(const Context<T>& ctx, size_t offset) const override {
        Parse<T> probe = child_->parse(ctx, offset);

        if (!probe.data.is_ok() || this->optional()) {
            return this->none(offset, offset);
        }

        std::optional<Span> span = probe.data.value().first_span();
        if (!span) {
            return this->fail(ctx.span_at(offset), offset, offset,
                              ParseError::EmptyMatch);
        }
        return this->fail(*span, offset, offset);
    }

private:
    ParserPtr<T> child_;
};

// Ordered alternation. The first Ok alternative is returned unchanged.
// On exhaustion the per-alternative errors are dropped in favour of one
// Err carrying this rule's label at the last token, or None if optional.
template<typename T>
class Choice : public Parser<T> {
public:
    Choice(std::string label, bool optional, ParserList<T> alternatives)
        : Parser<T>(std::move(label), optional),
          alternatives_(std::move(alternatives)) {}

    Parse<T> parse(const Context<T>& ctx, size_t offset) const override {
        for (const auto& alt : alternatives_) {
            Parse<T> attempt = alt->parse(ctx, offset);
            if (attempt.data.is_ok()) {
                return attempt;
            }
        }

        if (this->optional()) {
            return this->none(offset, offset);
        }
        return this->fail(ctx.span_last(), offset, offset);
    }

    size_t alternative_count() const { return alternatives_.size(); }

private:
    ParserList<T> alternatives_;
};

// ---------------------------------------------------------------------------
// Construction helpers
// ---------------------------------------------------------------------------

// Collects owning pointers into a ParserList (initializer lists cannot
// hold move-only elements).
template<typename T, typename... Ps>
ParserList<T> parsers(Ps&&... ps) {
    ParserList<T> list;
    list.reserve(sizeof...(Ps));
    (list.push_back(std::forward<Ps>(ps)), ...);
    return list;
}

template<typename T>
ParserPtr<T> of_type(std::string label, bool optional, T type) {
    return std::make_unique<OfType<T>>(std::move(label), optional, std::move(type));
}

template<typename T>
ParserPtr<T> predicate(std::string label, bool optional,
                       typename Predicate<T>::Test test) {
    return std::make_unique<Predicate<T>>(std::move(label), optional, std::move(test));
}

template<typename T>
ParserPtr<T> sequence(std::string label, bool optional, ParserList<T> children) {
    return std::make_unique<Sequence<T>>(std::move(label), optional, std::move(children));
}

template<typename T>
ParserPtr<T> repeatable(std::string label, bool optional, ParserPtr<T> child) {
    return std::make_unique<Repeatable<T>>(std::move(label), optional, std::move(child));
}

template<typename T>
ParserPtr<T> not_match(std::string label, bool optional, ParserPtr<T> child) {
    return std::make_unique<Not<T>>(std::move(label), optional, std::move(child));
}

template<typename T>
ParserPtr<T> choice(std::string label, bool optional, ParserList<T> alternatives) {
    return std::make_unique<Choice<T>>(std::move(label), optional, std::move(alternatives));
}

} // namespace pcomb
