#include <catch2/catch.hpp>
#include <pcomb/token.hpp>
#include <sstream>

using namespace pcomb;

TEST_CASE("default span is 1:1-1", "[span]") {
    Span s;
    CHECK(s.line == 1);
    CHECK(s.col_start == 1);
    CHECK(s.col_end == 1);
    CHECK(s.width() == 1);
}

TEST_CASE("span format and stream output", "[span]") {
    Span s(3, 4, 7);
    CHECK(s.format() == "3:4-7");

    std::ostringstream ss;
    ss << s;
    CHECK(ss.str() == "3:4-7");
}

TEST_CASE("span equality", "[span]") {
    CHECK(Span(2, 1, 5) == Span(2, 1, 5));
    CHECK(Span(2, 1, 5) != Span(2, 1, 4));
    CHECK(Span(2, 1, 5) != Span(3, 1, 5));
}

TEST_CASE("token span_size counts inclusive columns", "[span]") {
    Token<int> t{42, Span(1, 5, 9)};
    CHECK(t.span_size() == 5);
    CHECK(t.type == 42);

    Token<int> single{0, Span(1, 2, 2)};
    CHECK(single.span_size() == 1);
}
