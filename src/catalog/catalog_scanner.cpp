#include "catalog_scanner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fstream>
#include <algorithm>
#include <system_error>
#include <fmt/format.h>

const TemplateEntry* Catalog::find(const std::string& rel_path) const {
    for (const auto& e : entries) {
        if (e.rel_path == rel_path) return &e;
    }
    return nullptr;
}

CatalogScanner::CatalogScanner(const fs::path& root, ScanOptions options)
    : root_(root), options_(std::move(options)) {}

bool CatalogScanner::is_template(const std::string& filename) const {
    if (filename.empty() || filename[0] == '.') return false;

    for (const auto& ex : options_.exclude) {
        if (iequals(filename, ex)) return false;
    }

    std::string ext = fs::path(filename).extension().string();
    for (const auto& allowed : options_.extensions) {
        if (iequals(ext, allowed)) return true;
    }
    return false;
}

Result<Catalog> CatalogScanner::scan() const {
    std::error_code ec;

    if (!fs::exists(root_, ec)) {
        return Result<Catalog>::Err(ErrorKind::Configuration,
            fmt::format("Templates directory not found: {}", root_.string()));
    }
    if (!fs::is_directory(root_, ec)) {
        return Result<Catalog>::Err(ErrorKind::Configuration,
            fmt::format("Templates path is not a directory: {}", root_.string()));
    }

    // Probe readability up front so an unreadable root is reported, not
    // mistaken for an empty one
    fs::directory_iterator probe(root_, ec);
    if (ec) {
        return Result<Catalog>::Err(ErrorKind::Configuration,
            fmt::format("Cannot read templates directory {}: {}", root_.string(), ec.message()));
    }

    Catalog catalog;
    catalog.root = root_;
    scan_dir(root_, catalog.entries);

    pmerge_log(fmt::format("scan: root={} entries={}", root_.string(), catalog.entries.size()));
    return Result<Catalog>::Ok(std::move(catalog));
}

void CatalogScanner::scan_dir(const fs::path& dir, std::vector<TemplateEntry>& out) const {
    std::error_code ec;
    std::vector<fs::directory_entry> children;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        pmerge_log(fmt::format("scan: skipping unreadable directory {}: {}",
                               dir.string(), ec.message()));
        return;
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    for (const auto& child : children) {
        std::string name = child.path().filename().string();
        if (name.empty() || name[0] == '.') continue;

        // symlink_status: never descend through a directory symlink
        auto st = child.symlink_status(ec);
        if (ec) continue;

        if (fs::is_directory(st)) {
            scan_dir(child.path(), out);
        } else if (child.is_regular_file(ec) && is_template(name)) {
            out.push_back(make_entry(child.path()));
        }
    }
}

TemplateEntry CatalogScanner::make_entry(const fs::path& file) const {
    TemplateEntry entry;
    entry.path = file;

    fs::path rel = file.lexically_relative(root_);
    entry.rel_path = rel.generic_string();
    entry.group = rel.parent_path().generic_string();
    entry.title = file.stem().string();
    entry.is_base = to_lower(file.filename().string()).find("base") != std::string::npos;

    read_header(entry);
    return entry;
}

// Title, extends hint and description come from the first few lines.
// An unreadable file keeps its filename title; merge reports it later.
void CatalogScanner::read_header(TemplateEntry& entry) const {
    std::ifstream in(entry.path);
    if (!in) {
        pmerge_log("scan: cannot open " + entry.rel_path + " for header");
        return;
    }

    bool have_heading = false;
    std::string line;
    for (int i = 0; i < HEADER_SCAN_LINES && std::getline(in, line); i++) {
        trim(line);

        if (starts_with(line, "# ")) {
            if (options_.title_from_heading && !have_heading) {
                std::string title = line.substr(2);
                trim(title);
                if (!title.empty()) {
                    entry.title = title;
                    have_heading = true;
                }
            }
        } else if (starts_with(line, EXTENDS_PREFIX)) {
            if (entry.extends.empty()) entry.extends = line;
        } else if (!line.empty() && line[0] != '#' && line[0] != '>') {
            entry.description = line.substr(0, DESCRIPTION_MAX_CHARS);
            if (line.size() > static_cast<size_t>(DESCRIPTION_MAX_CHARS)) {
                entry.description += "...";
            }
            break;
        }
    }
}
