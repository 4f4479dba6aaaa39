#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Discovers template files under a root directory.
//
// Traversal is depth-first; at every level the children are visited in
// lexicographic name order, so the catalog comes out ordered by relative
// path compared component by component. Hidden files and directories are
// skipped and directory symlinks are not followed.
class CatalogScanner {
public:
    explicit CatalogScanner(const fs::path& root, ScanOptions options = {});

    // Missing or unreadable root is a Configuration error.
    // No matching files is an empty catalog, not an error.
    Result<Catalog> scan() const;

    // Extension and exclude-list check on a bare file name
    bool is_template(const std::string& filename) const;

private:
    fs::path root_;
    ScanOptions options_;

    void scan_dir(const fs::path& dir, std::vector<TemplateEntry>& out) const;
    TemplateEntry make_entry(const fs::path& file) const;
    void read_header(TemplateEntry& entry) const;
};
