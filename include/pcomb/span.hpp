#pragma once

#include <cstddef>
#include <ostream>
#include <string>

namespace pcomb {

// Source location range on a single line. Columns are 1-based and
// col_end is inclusive, so col_end >= col_start always holds.
struct Span {
    size_t line = 1;
    size_t col_start = 1;
    size_t col_end = 1;

    Span() = default;
    Span(size_t ln, size_t cs, size_t ce)
        : line(ln), col_start(cs), col_end(ce) {}

    // Number of columns covered
    size_t width() const { return col_end - col_start + 1; }

    // "line:col_start-col_end"
    std::string format() const;

    bool operator==(const Span& o) const {
        return line == o.line && col_start == o.col_start && col_end == o.col_end;
    }
    bool operator!=(const Span& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const Span& span);

} // namespace pcomb
