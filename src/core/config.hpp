#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    Config() = default;

    // Defaults, then ~/.prompt-merge/config.yaml, then ./prompt-merge.yaml.
    // Missing files are skipped; a malformed file is a Configuration error.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Same layering with an explicit global config path
    static Result<Config> load(const fs::path& project_dir, const fs::path& global_path);

    // Built-in defaults only
    static Config defaults();

    // Accessors
    const fs::path& templates_dir() const { return templates_dir_; }
    const std::string& output() const { return output_; }
    const ScanOptions& scan() const { return scan_; }
    const MergeOptions& merge() const { return merge_; }

    // Config files that contributed, lowest precedence first
    const std::vector<fs::path>& sources() const { return sources_; }

    // Command-line overrides
    void set_templates_dir(const fs::path& dir) { templates_dir_ = dir; }
    void set_output(const std::string& path) { output_ = path; }
    void set_base_first(bool on) { merge_.base_first = on; }
    void set_header(bool on) { merge_.header = on; }

private:
    // Overlay keys present in `file` onto this config
    Result<void> overlay(const fs::path& file);

    fs::path templates_dir_;
    std::string output_;
    ScanOptions scan_;
    MergeOptions merge_;
    std::vector<fs::path> sources_;
};

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// templates/ beside the executable, or ./templates if that can't be resolved
fs::path default_templates_dir();
