#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / CONFIG_FILENAME;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

fs::path default_templates_dir() {
    auto exe_dir = platform::executable_dir();
    if (exe_dir) {
        return *exe_dir / DEFAULT_TEMPLATES_DIR;
    }
    return fs::current_path() / DEFAULT_TEMPLATES_DIR;
}

Config Config::defaults() {
    Config config;
    config.templates_dir_ = default_templates_dir();
    config.output_ = DEFAULT_OUTPUT;
    config.scan_.extensions = {DEFAULT_EXTENSION};
    config.scan_.exclude = {DEFAULT_EXCLUDE};
    config.merge_.document_title = DEFAULT_DOC_TITLE;
    return config;
}

// Accepts either a single string or a list of strings
static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    if (node.IsScalar()) {
        return {node.as<std::string>()};
    }
    return node.as<std::vector<std::string>>();
}

Result<void> Config::overlay(const fs::path& file) {
    try {
        YAML::Node root = YAML::LoadFile(file.string());

        // An empty file is a valid, empty config
        if (root.IsNull()) {
            sources_.push_back(file);
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err(ErrorKind::Configuration,
                fmt::format("Invalid config {}: expected a mapping at top level", file.string()));
        }

        if (root["templates_dir"]) {
            fs::path dir = root["templates_dir"].as<std::string>();
            // Relative paths resolve against the file that names them
            if (dir.is_relative()) {
                dir = file.parent_path() / dir;
            }
            templates_dir_ = dir.lexically_normal();
        }

        if (root["output"]) {
            output_ = root["output"].as<std::string>();
        }

        if (root["extensions"]) {
            scan_.extensions.clear();
            for (auto ext : parse_string_list(root["extensions"])) {
                if (!ext.empty() && ext[0] != '.') ext = "." + ext;
                scan_.extensions.push_back(ext);
            }
        }

        if (root["exclude"]) {
            scan_.exclude = parse_string_list(root["exclude"]);
        }

        // as<T>() without a fallback so a wrong type is reported, not ignored
        if (root["title_from_heading"]) {
            scan_.title_from_heading = root["title_from_heading"].as<bool>();
        }
        if (root["header"]) {
            merge_.header = root["header"].as<bool>();
        }
        if (root["document_title"]) {
            merge_.document_title = root["document_title"].as<std::string>();
        }
        if (root["base_first"]) {
            merge_.base_first = root["base_first"].as<bool>();
        }

        sources_.push_back(file);
        return Result<void>::Ok();
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Configuration,
            fmt::format("Failed to parse config {}: {}", file.string(), e.what()));
    }
}

Result<Config> Config::load(const fs::path& project_dir) {
    return load(project_dir, get_global_config_path());
}

Result<Config> Config::load(const fs::path& project_dir, const fs::path& global_path) {
    Config config = defaults();

    std::error_code ec;
    if (fs::exists(global_path, ec)) {
        auto r = config.overlay(global_path);
        if (r.is_err()) return Result<Config>::Err(r);
    }

    fs::path project_path = get_project_config_path(project_dir);
    if (fs::exists(project_path, ec)) {
        auto r = config.overlay(project_path);
        if (r.is_err()) return Result<Config>::Err(r);
    }

    return Result<Config>::Ok(config);
}
