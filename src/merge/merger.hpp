#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <selector/selection_set.hpp>

namespace fs = std::filesystem;

// Concatenates selected templates into one document.
//
// Content is copied byte for byte; every section is preceded by a
// "<!-- prompt-merge:source <rel_path> -->" marker. Validation happens
// before any file is read, and nothing is written by merge() itself.
class Merger {
public:
    explicit Merger(const Catalog& catalog, MergeOptions options = {});

    // Ids in selection order. Duplicates, unknown ids and an empty list
    // are Validation errors; an unreadable source is an IO error.
    Result<MergedDocument> merge(const std::vector<std::string>& ids) const;
    Result<MergedDocument> merge(const SelectionSet& selection) const;

    // Order the sections will appear in (applies base_first)
    std::vector<const TemplateEntry*> order(const std::vector<std::string>& ids) const;

private:
    const Catalog& catalog_;
    MergeOptions options_;

    Result<void> validate(const std::vector<std::string>& ids) const;
    std::string render(const MergedDocument& doc) const;
};

// Whole-file read in binary mode
Result<std::string> read_file(const fs::path& path);

// Write the document to `path` via a temporary file in the same directory
// and a rename, so a failure leaves no partial file behind.
Result<void> write_output(const MergedDocument& doc, const std::string& path);
