#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

struct CliOptions {
    bool list = false;
    bool help = false;
    bool version = false;
    bool verbose = false;
    bool base_first = false;
    bool no_header = false;
    std::optional<std::string> output;      // -o / --output
    std::optional<std::string> root;        // -r / --root
    std::vector<std::string> select;        // -s / --select, in the order given

    bool interactive() const { return select.empty(); }
};

// Parses argv[1..]. Unknown flags, a flag missing its value and unexpected
// positionals are Usage errors. "go" is accepted and ignored.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Help text for --help and usage errors
std::string usage_text();
