#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>
#include <selector/key_input.hpp>
#include "args.hpp"

namespace fs = std::filesystem;

// Front-end: parses arguments, loads config, and runs
// scan -> select -> merge -> write. Every failure is reported as one line on
// the error stream and turned into its exit code here.
class PromptMergeCLI {
public:
    PromptMergeCLI(std::ostream& out, std::ostream& err);

    int run(int argc, char** argv);
    int run(const std::vector<std::string>& args);

    // Where config files are looked up (tests point these at temp dirs)
    void set_project_dir(const fs::path& dir) { project_dir_ = dir; }
    void set_global_config_path(const fs::path& path) { global_config_ = path; }

    // Drive the picker from this source instead of the terminal
    void set_key_source(KeySource* keys) { keys_ = keys; }

    void print_usage() const;

private:
    int run_list(const Catalog& catalog);
    int run_merge(const Catalog& catalog, const Config& config, const CliOptions& opts);

    // One-line diagnostic on the error stream; returns the exit code for `kind`
    int fail(ErrorKind kind, const std::string& message);

    std::ostream& out_;
    std::ostream& err_;
    fs::path project_dir_;
    fs::path global_config_;
    KeySource* keys_ = nullptr;
};

int exit_code_for(ErrorKind kind);
