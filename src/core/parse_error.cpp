#include <pcomb/parse.hpp>

namespace pcomb {

std::string ParseError::format() const {
    std::string out = "expected ";
    out += expected;
    out += " at ";
    out += span.format();
    out += ": ";
    out += message ? message : SyntaxError;
    return out;
}

PcombError ParseError::to_error(const std::string& file) const {
    return PcombError{PcombError::Parse,
        std::string(message ? message : SyntaxError),
        "expected " + expected,
        file,
        static_cast<int>(span.line),
        static_cast<int>(span.col_start)};
}

} // namespace pcomb
