#include <quilt/config_file.hpp>
#include <quilt/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace quilt {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static Result<PathSpec> parse_tree(const toml::table& tbl, size_t index,
                                   const std::string& origin) {
    PathSpec spec;
    int line = tbl.source().begin.line > 0
        ? static_cast<int>(tbl.source().begin.line) : 0;

    if (auto v = tbl["local-name"].value<std::string>()) spec.local_name = *v;
    if (auto v = tbl["path"].value<std::string>()) spec.path = *v;
    if (auto v = tbl["uri"].value<std::string>()) spec.uri = *v;
    if (auto v = tbl["version"].value<std::string>()) spec.version = *v;

    if (auto v = tbl["scm"].value<std::string>()) {
        auto scm = parse_scm_type(*v);
        if (scm.is_err()) {
            auto err = std::move(scm).error();
            err.file = origin;
            err.line = line;
            return err;
        }
        spec.scm = scm.value();
    }

    auto status = spec.validate();
    if (status.is_err()) {
        auto err = std::move(status).error();
        err.message = "tree #" + std::to_string(index + 1) + ": " + err.message;
        err.file = origin;
        err.line = line;
        return err;
    }

    return Result<PathSpec>::ok(std::move(spec));
}

Result<std::vector<PathSpec>> parse_declarations(const std::string& toml_str,
                                                 const std::string& origin) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, origin);
    } catch (const toml::parse_error& e) {
        return QuiltError{QuiltError::Parse,
            std::string("declaration TOML parse error: ") + std::string(e.description()),
            "",
            origin,
            static_cast<int>(e.source().begin.line)};
    }

    std::vector<PathSpec> specs;

    auto* trees = doc["tree"].as_array();
    if (!trees) {
        if (doc.contains("tree")) {
            return QuiltError{QuiltError::Parse,
                "'tree' must be an array of tables",
                "declare each tree with a [[tree]] header", origin, 0};
        }
        return Result<std::vector<PathSpec>>::ok(std::move(specs));
    }

    for (size_t i = 0; i < trees->size(); ++i) {
        auto* tbl = trees->get(i)->as_table();
        if (!tbl) {
            return QuiltError{QuiltError::Parse,
                "tree #" + std::to_string(i + 1) + " must be a table",
                "", origin, 0};
        }
        auto spec = parse_tree(*tbl, i, origin);
        if (spec.is_err()) return std::move(spec).error();
        specs.push_back(std::move(spec).value());
    }

    return Result<std::vector<PathSpec>>::ok(std::move(specs));
}

Result<std::vector<PathSpec>> load_declarations(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return QuiltError{QuiltError::Source,
            "cannot open declaration file: " + file.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_declarations(ss.str(), file.string());
}

// ---------------------------------------------------------------------------
// Persisting
// ---------------------------------------------------------------------------

static std::string persisted_path(const fs::path& path, const fs::path& base) {
    std::error_code ec;
    fs::path rel = fs::relative(path, base, ec);
    if (ec || rel.empty() || rel.string().rfind("..", 0) == 0) {
        return path.string();
    }
    return rel.string();
}

static toml::array tree_array(const Config& config) {
    toml::array trees;
    for (const auto& element : config.elements()) {
        PathSpec spec = element->path_spec();

        toml::table tree;
        tree.insert("local-name", spec.local_name);
        std::string path = persisted_path(element->path(), config.base_path());
        if (path != spec.local_name) tree.insert("path", path);
        if (spec.is_vcs()) {
            tree.insert("scm", std::string(scm_name(spec.scm)));
            if (spec.uri) tree.insert("uri", *spec.uri);
            if (spec.version) tree.insert("version", *spec.version);
        }
        trees.push_back(std::move(tree));
    }
    return trees;
}

static std::string render(const toml::table& doc, const std::string& header) {
    std::ostringstream out;
    if (!header.empty()) {
        std::istringstream lines(header);
        std::string line;
        while (std::getline(lines, line)) {
            out << "# " << line << "\n";
        }
        out << "\n";
    }
    out << doc << "\n";
    return out.str();
}

Status persist_config(const Config& config, const fs::path& filename,
                      const std::string& header) {
    std::error_code ec;
    if (filename.has_parent_path()) {
        fs::create_directories(filename.parent_path(), ec);
    }

    // Tables other than [[tree]] (settings) survive a rewrite
    toml::table doc;
    if (fs::is_regular_file(filename, ec)) {
        try {
            doc = toml::parse_file(filename.string());
        } catch (const toml::parse_error& e) {
            return QuiltError{QuiltError::Parse,
                "refusing to overwrite unparsable file: " + std::string(e.description()),
                "", filename.string(), static_cast<int>(e.source().begin.line)};
        }
        doc.erase("tree");
    }
    doc.insert("tree", tree_array(config));

    std::ofstream out(filename);
    if (!out.is_open()) {
        return QuiltError{QuiltError::IO,
            "cannot write declaration file: " + filename.string()};
    }
    out << render(doc, header);
    if (!out) {
        return QuiltError{QuiltError::IO,
            "failed writing declaration file: " + filename.string()};
    }
    return ok_status();
}

} // namespace quilt
