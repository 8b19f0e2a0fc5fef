#include <pcomb/error.hpp>

namespace pcomb {

const char* PcombError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case Limit:      return "Limit";
        case Internal:   return "Internal";
    }
    return "Unknown";
}

std::string PcombError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (col > 0) {
                result += ":";
                result += std::to_string(col);
            }
        }
    }

    return result;
}

} // namespace pcomb
