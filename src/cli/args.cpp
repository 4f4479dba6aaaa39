#include "args.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

// Splits "--output=x" into ("--output", "x")
static bool split_inline_value(const std::string& arg, std::string& flag, std::string& value) {
    if (!starts_with(arg, "--")) return false;
    auto eq = arg.find('=');
    if (eq == std::string::npos) return false;
    flag = arg.substr(0, eq);
    value = arg.substr(eq + 1);
    return true;
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    using R = Result<CliOptions>;
    CliOptions opts;

    for (size_t i = 0; i < args.size(); i++) {
        std::string arg = args[i];
        std::string flag, inline_value;
        bool has_inline = split_inline_value(args[i], flag, inline_value);
        if (has_inline) {
            arg = flag;
            if (arg != "--output" && arg != "--root" && arg != "--select") {
                return R::Err(ErrorKind::Usage, "Option does not take a value: " + args[i]);
            }
        }

        // Fetch the value for a flag that takes one
        auto take_value = [&](std::string& out) -> bool {
            if (has_inline) {
                out = inline_value;
                return true;
            }
            if (i + 1 >= args.size()) return false;
            out = args[++i];
            return true;
        };

        if (arg == "-l" || arg == "--list") {
            opts.list = true;
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--base-first") {
            opts.base_first = true;
        } else if (arg == "--no-header") {
            opts.no_header = true;
        } else if (arg == "-o" || arg == "--output") {
            std::string v;
            if (!take_value(v) || v.empty()) {
                return R::Err(ErrorKind::Usage, "Missing value for " + arg);
            }
            opts.output = v;
        } else if (arg == "-r" || arg == "--root") {
            std::string v;
            if (!take_value(v) || v.empty()) {
                return R::Err(ErrorKind::Usage, "Missing value for " + arg);
            }
            opts.root = v;
        } else if (arg == "-s" || arg == "--select") {
            std::string v;
            if (!take_value(v) || v.empty()) {
                return R::Err(ErrorKind::Usage, "Missing value for " + arg);
            }
            opts.select.push_back(v);
        } else if (arg == "go") {
            // Accepted for compatibility; interactive merge is the default
        } else if (starts_with(arg, "-")) {
            return R::Err(ErrorKind::Usage, "Unknown option: " + args[i]);
        } else {
            return R::Err(ErrorKind::Usage, "Unexpected argument: " + args[i]);
        }
    }

    return R::Ok(opts);
}

std::string usage_text() {
    std::string out;
    out += theme::section("Usage");
    out += "  prompt-merge [go] [options]\n";
    out += theme::section("Options");
    out += theme::kv("-l", "--list             List available templates and exit");
    out += theme::kv("-o", "--output <path>    Output file (default: CLAUDE.md, - for stdout)");
    out += theme::kv("-r", "--root <dir>       Templates directory");
    out += theme::kv("-s", "--select <path>    Select a template without the picker (repeatable)");
    out += theme::kv("", "--base-first       Put [BASE] templates first");
    out += theme::kv("", "--no-header        Omit the generated header");
    out += theme::kv("-v", "--verbose          Echo debug log to stderr");
    out += theme::kv("-h", "--help             Show this help");
    out += theme::kv("", "--version          Show version");
    out += "\n";
    return out;
}
