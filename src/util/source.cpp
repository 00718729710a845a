#include <quilt/source.hpp>
#include <quilt/config_file.hpp>
#include <quilt/log.hpp>

namespace quilt {

namespace fs = std::filesystem;

Result<std::vector<PathSpec>> FileSource::declarations() const {
    std::error_code ec;
    if (!fs::is_regular_file(file_, ec)) {
        return QuiltError{QuiltError::Source,
            "declaration source not found: " + file_.string()};
    }
    return load_declarations(file_);
}

Result<std::vector<PathSpec>> DirectorySource::declarations() const {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        return QuiltError{QuiltError::Source,
            "not a directory: " + dir_.string()};
    }

    if (!config_filename_.empty()) {
        fs::path candidate = dir_ / config_filename_;
        if (fs::is_regular_file(candidate, ec)) {
            return load_declarations(candidate);
        }
    }

    PathSpec spec;
    spec.local_name = fs::absolute(dir_, ec).lexically_normal().string();
    if (ec) spec.local_name = dir_.string();
    while (spec.local_name.size() > 1 && spec.local_name.back() == '/') {
        spec.local_name.pop_back();
    }
    std::vector<PathSpec> specs;
    specs.push_back(std::move(spec));
    return Result<std::vector<PathSpec>>::ok(std::move(specs));
}

Result<std::vector<PathSpec>> SpecListSource::declarations() const {
    for (const auto& spec : specs_) {
        QUILT_TRY(spec.validate());
    }
    return Result<std::vector<PathSpec>>::ok(specs_);
}

static bool is_remote_uri(const std::string& uri) {
    return uri.rfind("http://", 0) == 0 || uri.rfind("https://", 0) == 0;
}

Result<std::unique_ptr<DeclarationSource>> source_for_uri(const std::string& uri,
                                                          const std::string& config_filename) {
    using SourcePtr = std::unique_ptr<DeclarationSource>;

    if (is_remote_uri(uri)) {
        return QuiltError{QuiltError::Source,
            "remote declaration sources are not supported: " + uri,
            "download the file and pass its local path"};
    }

    std::error_code ec;
    if (fs::is_directory(uri, ec)) {
        return Result<SourcePtr>::ok(
            std::make_unique<DirectorySource>(uri, config_filename));
    }
    return Result<SourcePtr>::ok(std::make_unique<FileSource>(uri));
}

Result<std::vector<PathSpec>> collect_declarations(const SourceList& sources) {
    std::vector<PathSpec> all;
    for (const auto& source : sources) {
        auto specs = source->declarations();
        if (specs.is_err()) return std::move(specs).error();

        quilt::log::debug("%zu declarations from %s",
                          specs.value().size(), source->describe().c_str());
        for (auto& spec : specs.value()) {
            all.push_back(std::move(spec));
        }
    }
    return Result<std::vector<PathSpec>>::ok(std::move(all));
}

} // namespace quilt
