#include <quilt/scm.hpp>
#include <sstream>

namespace quilt {

const char* scm_name(ScmType type) {
    switch (type) {
        case ScmType::Git:  return "git";
        case ScmType::Svn:  return "svn";
        case ScmType::Hg:   return "hg";
        case ScmType::Bzr:  return "bzr";
        case ScmType::Tar:  return "tar";
        case ScmType::None: return "none";
    }
    return "unknown";
}

Result<ScmType> parse_scm_type(const std::string& name) {
    if (name.empty()) return Result<ScmType>::ok(ScmType::None);
    for (ScmType t : {ScmType::Git, ScmType::Svn, ScmType::Hg,
                      ScmType::Bzr, ScmType::Tar, ScmType::None}) {
        if (name == scm_name(t)) return Result<ScmType>::ok(t);
    }
    return QuiltError{QuiltError::Parse,
        "unknown scm type '" + name + "'",
        "expected one of: git, svn, hg, bzr, tar"};
}

int status_marker_columns(ScmType type) {
    switch (type) {
        case ScmType::Git:  return 3;
        case ScmType::Hg:   return 2;
        case ScmType::Bzr:  return 4;
        case ScmType::Svn:
        case ScmType::Tar:
        case ScmType::None:
            return -1;
    }
    return -1;
}

std::string align_status(ScmType type, const std::string& status) {
    int columns = status_marker_columns(type);
    if (columns < 0) return status;

    auto width = static_cast<size_t>(columns);
    auto padded = static_cast<size_t>(kAlignedStatusColumns);
    std::string aligned;
    std::istringstream stream(status);
    std::string line;
    while (std::getline(stream, line)) {
        std::string marker = line.substr(0, width);
        if (marker.size() < padded) marker.append(padded - marker.size(), ' ');
        aligned += marker;
        if (line.size() > width) aligned += line.substr(width);
        aligned += '\n';
    }
    return aligned;
}

} // namespace quilt
