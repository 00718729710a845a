#pragma once

#include <quilt/result.hpp>
#include <string>

namespace quilt {

enum class ScmType { Git, Svn, Hg, Bzr, Tar, None };

// Canonical lowercase name: "git", "svn", "hg", "bzr", "tar", "none"
const char* scm_name(ScmType type);

// Parse a declaration's scm key. Empty string maps to ScmType::None.
Result<ScmType> parse_scm_type(const std::string& name);

// Width of the change-type marker in a backend's status lines,
// or -1 when the backend's output is passed through unmodified.
int status_marker_columns(ScmType type);

// Column every backend's marker is padded to, matching svn's native layout
constexpr int kAlignedStatusColumns = 8;

// Pad the first status_marker_columns(type) characters of every line to
// kAlignedStatusColumns. Output of unknown-width backends is returned as-is.
std::string align_status(ScmType type, const std::string& status);

} // namespace quilt
