#pragma once

#include <string>

namespace tyck {

struct TyckError {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        Regex
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    TyckError() = default;
    TyckError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TyckError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TyckError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace tyck
