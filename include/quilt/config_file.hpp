#pragma once

#include <quilt/result.hpp>
#include <quilt/path_spec.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace quilt {

class Config;

// Default name of the declaration file in a workspace root
constexpr const char* kDefaultConfigFilename = ".quilt.toml";

// Parse the ordered [[tree]] entries of a declaration file. `origin` names
// the file in error messages. Tables other than [[tree]] are ignored.
Result<std::vector<PathSpec>> parse_declarations(const std::string& toml_str,
                                                 const std::string& origin = "");

// Read and parse a declaration file
Result<std::vector<PathSpec>> load_declarations(const std::filesystem::path& file);

// Write the configuration to filename, keeping any other tables already
// there. Each header line becomes a comment; element paths inside the base
// path are written relative to it.
Status persist_config(const Config& config, const std::filesystem::path& filename,
                      const std::string& header = "");

} // namespace quilt
