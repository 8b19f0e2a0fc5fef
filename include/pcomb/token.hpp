#pragma once

#include <pcomb/span.hpp>
#include <vector>

namespace pcomb {

// Generic token over a caller-defined token type. T must be
// equality-comparable and copyable.
template<typename T>
struct Token {
    T type;
    Span span;

    size_t span_size() const { return span.width(); }
};

template<typename T>
using TokenStream = std::vector<Token<T>>;

} // namespace pcomb
