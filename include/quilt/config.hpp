#pragma once

#include <quilt/result.hpp>
#include <quilt/element.hpp>
#include <quilt/path_spec.hpp>
#include <quilt/source.hpp>
#include <quilt/vcs/client.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace quilt {

// The deduplicated, ordered set of workspace elements. Read-only once built.
class Config {
public:
    // Build from declarations in order. Declarations resolving to the same
    // path collapse to the last one, which keeps its own position.
    static Result<Config> build(const std::vector<PathSpec>& specs,
                                const std::filesystem::path& base_path,
                                const vcs::VcsRegistry& registry,
                                std::string config_filename = "");

    const std::vector<std::unique_ptr<Element>>& elements() const { return elements_; }
    size_t size() const { return elements_.size(); }
    bool empty() const { return elements_.empty(); }

    // First element with this local name, or nullptr
    const Element* find(const std::string& local_name) const;

    const std::filesystem::path& base_path() const { return base_path_; }

    // Declaration file name used when the configuration is persisted again
    const std::string& config_filename() const { return config_filename_; }

private:
    std::filesystem::path base_path_;
    std::string config_filename_;
    std::vector<std::unique_ptr<Element>> elements_;
};

// Resolve a declared path against base_path, normalized, no trailing slash
std::filesystem::path resolve_element_path(const std::string& declared,
                                           const std::filesystem::path& base_path);

// Merge the declarations of all sources into one configuration
Result<Config> aggregate(const SourceList& sources,
                         const std::filesystem::path& base_path,
                         const vcs::VcsRegistry& registry,
                         const std::string& config_filename = "");

// Build the configuration every command starts from. Without uris the
// declaration file base_path/config_filename is used.
Result<Config> get_config(const std::filesystem::path& base_path,
                          const std::optional<std::vector<std::string>>& uris,
                          const std::optional<std::string>& config_filename,
                          const vcs::VcsRegistry& registry);

} // namespace quilt
