#include <catch2/catch.hpp>
#include "test_tokens.hpp"

using namespace pcomb;

TEST_CASE("Sequence of matching children", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A, Tok::B, Tok::C});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("abc", false,
        parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B), tok("c", Tok::C)));

    auto p = seq->parse(ctx, 0);
    REQUIRE(p.data.is_ok());
    CHECK(p.type_parsed == "abc");
    CHECK(p.size() == 3);

    const auto& data = p.data.value();
    REQUIRE(data.is_nested());
    REQUIRE(data.nested().size() == 3);
    CHECK(data.nested()[0].token().type == Tok::A);
    CHECK(data.nested()[1].token().type == Tok::B);
    CHECK(data.nested()[2].token().type == Tok::C);
}

TEST_CASE("Sequence consumption is the sum of its children", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A, Tok::B, Tok::A, Tok::B, Tok::C});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("outer", false, parsers<Tok>(
        sequence<Tok>("ab", false, parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B))),
        sequence<Tok>("ab", false, parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B))),
        tok("c", Tok::C)));

    auto p = seq->parse(ctx, 0);
    REQUIRE(p.data.is_ok());
    CHECK(p.size() == 5);
    CHECK(p.data.value().nested().size() == 3);
}

TEST_CASE("Sequence starting mid-stream", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::C, Tok::A, Tok::B});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("ab", false, parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B)));

    auto p = seq->parse(ctx, 1);
    REQUIRE(p.data.is_ok());
    CHECK(p.start_offset == 1);
    CHECK(p.end_offset == 3);
}

TEST_CASE("Sequence skips children reporting none", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A, Tok::B});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("a c* b", false, parsers<Tok>(
        tok("a", Tok::A),
        repeatable<Tok>("cs", true, tok("c", Tok::C)),
        not_match<Tok>("not-c", false, tok("c", Tok::C)),
        tok("b", Tok::B)));

    auto p = seq->parse(ctx, 0);
    REQUIRE(p.data.is_ok());
    CHECK(p.size() == 2);
    REQUIRE(p.data.value().nested().size() == 2);
    CHECK(p.data.value().nested()[0].token().type == Tok::A);
    CHECK(p.data.value().nested()[1].token().type == Tok::B);
}

TEST_CASE("Sequence propagates the first child error", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A, Tok::C, Tok::C});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("abc", false,
        parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B), tok("c", Tok::C)));

    auto p = seq->parse(ctx, 0);
    REQUIRE(p.data.is_err());
    CHECK(p.type_parsed == "abc");
    CHECK(p.data.error().expected == "b");
    CHECK(p.data.error().span == Span(1, 2, 2));
    CHECK(p.start_offset == 0);
    CHECK(p.end_offset == 1);
}

TEST_CASE("Optional sequence downgrades errors to none", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A, Tok::C});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("ab", true, parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B)));

    auto p = seq->parse(ctx, 0);
    CHECK(p.data.is_none());
    // partial progress is still recorded
    CHECK(p.end_offset == 1);
}

TEST_CASE("Sequence runs out of input", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A});
    Context<Tok> ctx(toks);
    auto seq = sequence<Tok>("ab", false, parsers<Tok>(tok("a", Tok::A), tok("b", Tok::B)));

    auto p = seq->parse(ctx, 0);
    REQUIRE(p.data.is_err());
    CHECK(std::string(p.data.error().message) == "Unexpected end of input");
    CHECK(p.data.error().span == Span(1, 1, 1));
}

TEST_CASE("Empty sequence matches nothing successfully", "[combinators][sequence]") {
    auto toks = make_tokens({Tok::A});
    Context<Tok> ctx(toks);
    Sequence<Tok> seq("empty", false, ParserList<Tok>{});

    auto p = seq.parse(ctx, 0);
    REQUIRE(p.data.is_ok());
    CHECK(p.size() == 0);
    CHECK(p.data.value().nested().empty());
    CHECK(seq.child_count() == 0);
}
