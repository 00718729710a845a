#pragma once

#include <quilt/result.hpp>
#include <quilt/path_spec.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace quilt {

// Yields an ordered list of raw tree declarations
class DeclarationSource {
public:
    virtual ~DeclarationSource() = default;

    // Source-specific failures are returned unchanged to the caller
    virtual Result<std::vector<PathSpec>> declarations() const = 0;

    // Human-readable location for messages
    virtual std::string describe() const = 0;
};

// A declaration file on disk
class FileSource : public DeclarationSource {
public:
    explicit FileSource(std::filesystem::path file) : file_(std::move(file)) {}

    Result<std::vector<PathSpec>> declarations() const override;
    std::string describe() const override { return file_.string(); }

private:
    std::filesystem::path file_;
};

// A directory: its config_filename is read when present, otherwise the
// directory itself is declared as one plain tree
class DirectorySource : public DeclarationSource {
public:
    DirectorySource(std::filesystem::path dir, std::string config_filename)
        : dir_(std::move(dir)), config_filename_(std::move(config_filename)) {}

    Result<std::vector<PathSpec>> declarations() const override;
    std::string describe() const override { return dir_.string(); }

private:
    std::filesystem::path dir_;
    std::string config_filename_;
};

// Declarations supplied directly by the caller
class SpecListSource : public DeclarationSource {
public:
    explicit SpecListSource(std::vector<PathSpec> specs, std::string name = "<inline>")
        : specs_(std::move(specs)), name_(std::move(name)) {}

    Result<std::vector<PathSpec>> declarations() const override;
    std::string describe() const override { return name_; }

private:
    std::vector<PathSpec> specs_;
    std::string name_;
};

using SourceList = std::vector<std::unique_ptr<DeclarationSource>>;

// Map a uri (file, directory or remote url) to its declaration source
Result<std::unique_ptr<DeclarationSource>> source_for_uri(const std::string& uri,
                                                          const std::string& config_filename);

// Concatenate the declarations of every source, in source order
Result<std::vector<PathSpec>> collect_declarations(const SourceList& sources);

} // namespace quilt
