#include <quilt/config.hpp>
#include <quilt/log.hpp>
#include <unordered_map>
#include <unordered_set>
#include <algorithm>

namespace quilt {

namespace fs = std::filesystem;

fs::path resolve_element_path(const std::string& declared, const fs::path& base_path) {
    fs::path p(declared);
    if (p.is_relative()) p = base_path / p;
    p = p.lexically_normal();
    // "a/b/" normalizes to "a/b/" with an empty filename
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

static Result<std::unique_ptr<Element>> make_element(const PathSpec& spec,
                                                     const fs::path& path,
                                                     const vcs::VcsRegistry& registry) {
    std::string local_name = spec.local_name.empty() ? spec.declared_path()
                                                     : spec.local_name;
    if (!spec.is_vcs()) {
        return Result<std::unique_ptr<Element>>::ok(
            std::make_unique<OtherElement>(std::move(local_name), path));
    }

    auto client = registry.create(spec.scm, path);
    if (client.is_err()) {
        auto err = std::move(client).error();
        err.message = "tree '" + local_name + "': " + err.message;
        return err;
    }
    return Result<std::unique_ptr<Element>>::ok(
        std::make_unique<VcsElement>(std::move(local_name), path,
                                     std::move(client).value(),
                                     spec.uri.value_or(""), spec.version));
}

Result<Config> Config::build(const std::vector<PathSpec>& specs,
                             const fs::path& base_path,
                             const vcs::VcsRegistry& registry,
                             std::string config_filename) {
    if (base_path.empty()) {
        return QuiltError{QuiltError::Config,
            "Need to provide a basepath for Config."};
    }

    std::error_code ec;
    fs::path absolute_base = fs::absolute(base_path, ec);
    if (ec) {
        return QuiltError{QuiltError::Config,
            "cannot resolve basepath " + base_path.string() + ": " + ec.message()};
    }

    Config config;
    config.base_path_ = resolve_element_path(absolute_base.string(), absolute_base);
    config.config_filename_ = std::move(config_filename);

    std::vector<fs::path> paths;
    paths.reserve(specs.size());
    for (const auto& spec : specs) {
        QUILT_TRY(spec.validate());
        paths.push_back(resolve_element_path(spec.declared_path(), config.base_path_));
    }

    // Keep the last declaration per path, at its own index
    std::unordered_set<std::string> seen;
    std::vector<size_t> winners;
    for (size_t i = specs.size(); i-- > 0;) {
        if (seen.insert(paths[i].string()).second) {
            winners.push_back(i);
        } else {
            quilt::log::debug("declaration of %s overrides an earlier one",
                              paths[i].c_str());
        }
    }
    std::reverse(winners.begin(), winners.end());

    for (size_t i : winners) {
        auto element = make_element(specs[i], paths[i], registry);
        if (element.is_err()) return std::move(element).error();
        config.elements_.push_back(std::move(element).value());
    }

    std::unordered_map<std::string, const Element*> names;
    for (const auto& e : config.elements_) {
        if (!names.emplace(e->local_name(), e.get()).second) {
            quilt::log::warn("local name '%s' is used by more than one tree; "
                             "selecting it by name picks the first",
                             e->local_name().c_str());
        }
    }

    return Result<Config>::ok(std::move(config));
}

const Element* Config::find(const std::string& local_name) const {
    for (const auto& e : elements_) {
        if (e->local_name() == local_name) return e.get();
    }
    return nullptr;
}

Result<Config> aggregate(const SourceList& sources,
                         const fs::path& base_path,
                         const vcs::VcsRegistry& registry,
                         const std::string& config_filename) {
    auto specs = collect_declarations(sources);
    if (specs.is_err()) return std::move(specs).error();

    if (specs.value().empty()) {
        std::string where;
        for (const auto& s : sources) {
            if (!where.empty()) where += ", ";
            where += s->describe();
        }
        return QuiltError{QuiltError::Config,
            "no tree declarations found" + (where.empty() ? "" : " in " + where)};
    }

    return Config::build(specs.value(), base_path, registry, config_filename);
}

Result<Config> get_config(const fs::path& base_path,
                          const std::optional<std::vector<std::string>>& uris,
                          const std::optional<std::string>& config_filename,
                          const vcs::VcsRegistry& registry) {
    if (base_path.empty()) {
        return QuiltError{QuiltError::Config,
            "Need to provide a basepath for Config."};
    }

    std::vector<std::string> locations;
    if (uris.has_value()) {
        locations = *uris;
    } else if (config_filename.has_value()) {
        locations.push_back((base_path / *config_filename).string());
    } else {
        return QuiltError{QuiltError::Config, "no source config file found!",
            "pass a declaration file or name the workspace config file"};
    }

    std::string filename = config_filename.value_or("");
    SourceList sources;
    for (const auto& uri : locations) {
        auto source = source_for_uri(uri, filename);
        if (source.is_err()) return std::move(source).error();
        sources.push_back(std::move(source).value());
    }

    return aggregate(sources, base_path, registry, filename);
}

} // namespace quilt
