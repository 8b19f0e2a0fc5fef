#pragma once

#include <pcomb/parse.hpp>
#include <ostream>
#include <sstream>
#include <string>

namespace pcomb {

template<typename T>
size_t count_tokens(const ParseData<T>& data) {
    switch (data.kind()) {
    case DataKind::Token:
        return 1;
    case DataKind::TokenList:
        return data.tokens().size();
    case DataKind::Nested: {
        size_t n = 0;
        for (const auto& child : data.nested()) n += count_tokens(child);
        return n;
    }
    }
    return 0;
}

// Writes one line per node, children indented by two spaces:
//
//   nested[2]
//     Id "a" @1:1-1
//     tokens[0]
//
// describe(const T&) supplies the text for a token type.
template<typename T, typename Describe>
void dump_to(std::ostream& out, const ParseData<T>& data,
             const Describe& describe, int indent = 0) {
    std::string pad(static_cast<size_t>(indent) * 2, ' ');

    switch (data.kind()) {
    case DataKind::Token:
        out << pad << describe(data.token().type)
            << " @" << data.token().span << "\n";
        break;
    case DataKind::TokenList:
        out << pad << "tokens[" << data.tokens().size() << "]\n";
        for (const auto& tok : data.tokens()) {
            out << pad << "  " << describe(tok.type) << " @" << tok.span << "\n";
        }
        break;
    case DataKind::Nested:
        out << pad << "nested[" << data.nested().size() << "]\n";
        for (const auto& child : data.nested()) {
            dump_to(out, child, describe, indent + 1);
        }
        break;
    }
}

template<typename T, typename Describe>
std::string dump(const ParseData<T>& data, const Describe& describe) {
    std::ostringstream ss;
    dump_to(ss, data, describe);
    return ss.str();
}

} // namespace pcomb
