#pragma once

#include <string>

namespace quilt {

struct QuiltError {
    enum Code {
        IO,
        Parse,
        Config,
        Selection,
        Preparation,
        Install,
        Source,
        Vcs,
        NotFound,
        InvalidArg,
        Internal
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    QuiltError() = default;
    QuiltError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    QuiltError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    QuiltError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace quilt
