#include <quilt/selector.hpp>
#include <filesystem>

namespace quilt {

namespace fs = std::filesystem;

// Symlinks resolved as far as the path exists
static fs::path real_path(const fs::path& p) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(p, ec);
    if (ec) resolved = fs::absolute(p, ec).lexically_normal();
    if (!resolved.has_filename() && resolved.has_parent_path() &&
        resolved != resolved.root_path()) {
        resolved = resolved.parent_path();
    }
    return resolved;
}

Result<const Element*> select_element(const std::vector<std::unique_ptr<Element>>& elements,
                                      const std::optional<std::string>& local_name_or_path) {
    if (!local_name_or_path.has_value()) {
        return Result<const Element*>::ok(nullptr);
    }

    const std::string& query = *local_name_or_path;
    fs::path query_real = real_path(query);

    const Element* path_candidate = nullptr;
    for (const auto& element : elements) {
        if (element->local_name() == query) {
            return Result<const Element*>::ok(element.get());
        }
        if (real_path(element->path()) == query_real) {
            path_candidate = element.get();
        }
    }

    if (!path_candidate) {
        return QuiltError{QuiltError::Selection,
            "No config element matches; " + query};
    }
    return Result<const Element*>::ok(path_candidate);
}

} // namespace quilt
