#pragma once

#include <string>

namespace pcomb {

struct PcombError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        Limit,
        Internal
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int col = 0;

    PcombError() = default;
    PcombError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PcombError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PcombError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}
    PcombError(Code c, std::string msg, std::string h, std::string f, int l, int cl)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), col(cl) {}

    // Renders "error[Code]: message" followed by optional hint and location lines
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pcomb
