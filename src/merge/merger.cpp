#include "merger.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <iterator>
#include <set>
#include <optional>
#include <algorithm>
#include <system_error>
#include <unistd.h>
#include <fmt/format.h>

Merger::Merger(const Catalog& catalog, MergeOptions options)
    : catalog_(catalog), options_(std::move(options)) {}

Result<void> Merger::validate(const std::vector<std::string>& ids) const {
    if (ids.empty()) {
        return Result<void>::Err(ErrorKind::Validation, "No templates selected");
    }

    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("Template selected more than once: {}", id));
        }
        if (!catalog_.find(id)) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("Unknown template: {}", id));
        }
    }
    return Result<void>::Ok();
}

std::vector<const TemplateEntry*> Merger::order(const std::vector<std::string>& ids) const {
    std::vector<const TemplateEntry*> entries;
    for (const auto& id : ids) {
        const TemplateEntry* e = catalog_.find(id);
        if (e) entries.push_back(e);
    }

    if (options_.base_first) {
        std::stable_partition(entries.begin(), entries.end(),
                              [](const TemplateEntry* e) { return e->is_base; });
    }
    return entries;
}

Result<MergedDocument> Merger::merge(const SelectionSet& selection) const {
    return merge(selection.ids());
}

Result<MergedDocument> Merger::merge(const std::vector<std::string>& ids) const {
    auto valid = validate(ids);
    if (valid.is_err()) return Result<MergedDocument>::Err(valid);

    MergedDocument doc;
    for (const TemplateEntry* e : order(ids)) {
        auto content = read_file(e->path);
        if (content.is_err()) {
            return Result<MergedDocument>::Err(ErrorKind::IO,
                fmt::format("Cannot read template {}: {}", e->rel_path, content.error));
        }
        doc.sections.push_back({e, std::move(content.value)});
        doc.sources.push_back(e->rel_path);
    }

    doc.text = render(doc);
    pmerge_log(fmt::format("merge: {} section(s): {}", doc.sections.size(), join(doc.sources, ", ")));
    return Result<MergedDocument>::Ok(std::move(doc));
}

std::string Merger::render(const MergedDocument& doc) const {
    std::string out;

    if (options_.header) {
        out += "# " + options_.document_title + "\n\n";
        out += std::string(GENERATED_MARKER) + "\n";
        out += fmt::format(SOURCES_MARKER, join(doc.sources, ", ")) + "\n";
    }

    for (size_t i = 0; i < doc.sections.size(); i++) {
        const auto& s = doc.sections[i];
        if (!out.empty()) out += "\n";
        out += fmt::format(SOURCE_MARKER, s.entry->rel_path) + "\n";
        out += s.content;
        // Keep the next marker on a line of its own
        if (!s.content.empty() && s.content.back() != '\n') out += "\n";
    }
    return out;
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::IO, "file not found or unreadable");
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<std::string>::Err(ErrorKind::IO, "read failed");
    }
    return Result<std::string>::Ok(std::move(data));
}

Result<void> write_output(const MergedDocument& doc, const std::string& path) {
    fs::path target(path);
    fs::path dir = target.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Output directory does not exist: {}", dir.string()));
    }
    if (fs::is_directory(target, ec)) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Output path is a directory: {}", path));
    }

    // An existing target keeps its mode; a read-only one is refused rather
    // than replaced by the rename. Root passes access(), so the write bits
    // are checked as well.
    std::optional<fs::perms> keep_perms;
    auto st = fs::status(target, ec);
    if (!ec && fs::exists(st)) {
        const fs::perms any_write = fs::perms::owner_write | fs::perms::group_write |
                                    fs::perms::others_write;
        if (access(target.c_str(), W_OK) != 0 ||
            (st.permissions() & any_write) == fs::perms::none) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Cannot write output file: {}", path));
        }
        keep_perms = st.permissions();
    }

    fs::path tmp = dir / fmt::format(".{}.{}.tmp", target.filename().string(), getpid());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Cannot write output file: {}", path));
        }
        out << doc.text;
        out.close();
        if (!out) {
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Failed writing output file: {}", path));
        }
    }

    if (keep_perms) {
        fs::permissions(tmp, *keep_perms, fs::perm_options::replace, ec);
        if (ec) {
            std::error_code ignore;
            fs::remove(tmp, ignore);
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Cannot set permissions on output file {}: {}", path, ec.message()));
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignore;
        fs::remove(tmp, ignore);
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Cannot write output file {}: {}", path, ec.message()));
    }

    pmerge_log(fmt::format("write: {} ({} bytes)", path, doc.text.size()));
    return Result<void>::Ok();
}
