#include "prompt_merge_cli.hpp"
#include "theme.hpp"
#include <catalog/catalog_scanner.hpp>
#include <selector/interactive_selector.hpp>
#include <merge/merger.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <optional>
#include <map>
#include <fmt/format.h>

int exit_code_for(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:          return PM_EXIT_OK;
    case ErrorKind::Configuration: return PM_EXIT_CONFIG_ERROR;
    case ErrorKind::Validation:    return PM_EXIT_VALIDATION;
    case ErrorKind::IO:            return PM_EXIT_IO_ERROR;
    case ErrorKind::Usage:         return PM_EXIT_USAGE;
    }
    return PM_EXIT_INTERNAL;
}

PromptMergeCLI::PromptMergeCLI(std::ostream& out, std::ostream& err)
    : out_(out), err_(err),
      project_dir_(fs::current_path()),
      global_config_(get_global_config_path()) {}

int PromptMergeCLI::fail(ErrorKind kind, const std::string& message) {
    pmerge_log("error: " + message);
    theme::StderrColor color;
    err_ << theme::fail(message);
    return exit_code_for(kind);
}

void PromptMergeCLI::print_usage() const {
    out_ << usage_text();
}

int PromptMergeCLI::run(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; i++) args.emplace_back(argv[i]);
    return run(args);
}

int PromptMergeCLI::run(const std::vector<std::string>& args) {
    auto parsed = parse_args(args);
    if (parsed.is_err()) {
        int code = fail(parsed.kind, parsed.error);
        theme::StderrColor color;
        err_ << usage_text();
        return code;
    }
    const CliOptions& opts = parsed.value;

    pmerge_log_verbose() = opts.verbose;
    pmerge_log(fmt::format("run: started {} with {} arg(s)", now_iso(), args.size()));

    if (opts.help) {
        print_usage();
        return PM_EXIT_OK;
    }
    if (opts.version) {
        out_ << theme::bold("prompt-merge") << theme::dim(fmt::format(" version {}", PROMPT_MERGE_VERSION)) << "\n";
        return PM_EXIT_OK;
    }

    auto config_result = Config::load(project_dir_, global_config_);
    if (config_result.is_err()) {
        return fail(config_result.kind, config_result.error);
    }
    Config config = config_result.value;
    for (const auto& src : config.sources()) {
        pmerge_log("config: loaded " + src.string());
    }

    if (opts.root) config.set_templates_dir(*opts.root);
    if (opts.output) config.set_output(*opts.output);
    if (opts.base_first) config.set_base_first(true);
    if (opts.no_header) config.set_header(false);

    CatalogScanner scanner(config.templates_dir(), config.scan());
    auto catalog = scanner.scan();
    if (catalog.is_err()) {
        return fail(catalog.kind, catalog.error);
    }

    if (opts.list) {
        return run_list(catalog.value);
    }

    if (catalog.value.empty()) {
        return fail(ErrorKind::Configuration,
                    fmt::format("No templates available in {}", config.templates_dir().string()));
    }

    return run_merge(catalog.value, config, opts);
}

int PromptMergeCLI::run_list(const Catalog& catalog) {
    if (catalog.empty()) {
        theme::StderrColor color;
        err_ << theme::info(fmt::format("No templates available in {}", catalog.root.string()));
        return PM_EXIT_OK;
    }

    out_ << theme::section("Available templates");

    // Subdirectories interleave with files in path order, so collect each
    // group's entries first. Groups appear in order of first entry.
    std::vector<std::string> groups;
    std::map<std::string, std::vector<const TemplateEntry*>> by_group;
    for (const auto& e : catalog.entries) {
        auto& members = by_group[e.group];
        if (members.empty()) groups.push_back(e.group);
        members.push_back(&e);
    }

    for (const auto& group : groups) {
        out_ << theme::brown(group.empty() ? "(root)" : group) << "\n";

        for (const TemplateEntry* e : by_group[group]) {
            std::string marker = e->is_base ? theme::yellow(" [BASE]") : "";
            out_ << "  " << theme::blue(e->rel_path) << marker << "  " << e->title << "\n";

            if (pmerge_log_verbose()) {
                if (!e->description.empty()) out_ << "      " << theme::dim(e->description) << "\n";
                if (!e->extends.empty()) out_ << "      " << theme::dim(e->extends) << "\n";
            }
        }
    }

    out_ << "\n" << fmt::format("Total: {} template(s)", catalog.size()) << "\n";
    return PM_EXIT_OK;
}

int PromptMergeCLI::run_merge(const Catalog& catalog, const Config& config, const CliOptions& opts) {
    std::vector<std::string> ids;

    if (opts.interactive()) {
        InteractiveSelector selector(catalog);
        std::optional<SelectionSet> selection;

        if (keys_) {
            theme::StderrColor color;
            selection = selector.run(*keys_, err_, 24, 80);
        } else {
            auto r = selector.run();
            if (r.is_err()) return fail(r.kind, r.error);
            selection = r.value;
        }

        // Cancelling is a normal outcome: nothing written, success
        if (!selection) {
            pmerge_log("merge: cancelled by user, nothing written");
            return PM_EXIT_OK;
        }
        ids = selection->ids();
    } else {
        for (const auto& s : opts.select) {
            ids.push_back(fs::path(s).lexically_normal().generic_string());
        }
    }

    Merger merger(catalog, config.merge());
    auto doc = merger.merge(ids);
    if (doc.is_err()) {
        return fail(doc.kind, doc.error);
    }

    const std::string& output = config.output();
    std::ostream* summary = &out_;

    if (output == STDOUT_PATH) {
        out_ << doc.value.text << std::flush;
        if (!out_) return fail(ErrorKind::IO, "Failed to write to standard output");
        summary = &err_;
    } else {
        auto written = write_output(doc.value, output);
        if (written.is_err()) {
            return fail(written.kind, written.error);
        }
    }

    std::optional<theme::StderrColor> err_color;
    if (summary == &err_) err_color.emplace();

    *summary << theme::ok(fmt::format("Merged {} template(s) into {}",
                                      doc.value.sections.size(),
                                      output == STDOUT_PATH ? "stdout" : output));
    for (const auto& src : doc.value.sources) {
        *summary << theme::step(src);
    }
    return PM_EXIT_OK;
}
