#include <quilt/error.hpp>

namespace quilt {

const char* QuiltError::code_name(Code c) {
    switch (c) {
        case IO:          return "IO";
        case Parse:       return "Parse";
        case Config:      return "Config";
        case Selection:   return "Selection";
        case Preparation: return "Preparation";
        case Install:     return "Install";
        case Source:      return "Source";
        case Vcs:         return "Vcs";
        case NotFound:    return "NotFound";
        case InvalidArg:  return "InvalidArg";
        case Internal:    return "Internal";
    }
    return "Unknown";
}

std::string QuiltError::format() const {
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
        }
    }

    return result;
}

} // namespace quilt
