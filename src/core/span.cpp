#include <pcomb/span.hpp>

namespace pcomb {

std::string Span::format() const {
    std::string out = std::to_string(line);
    out += ":";
    out += std::to_string(col_start);
    out += "-";
    out += std::to_string(col_end);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Span& span) {
    return os << span.format();
}

} // namespace pcomb
