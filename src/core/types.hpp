#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>

// Failure classes reported to the user. Each maps to its own exit code.
enum class ErrorKind {
    None,
    Configuration,   // bad or missing root directory, malformed config
    Validation,      // duplicate or unknown selection, empty selection
    IO,              // unreadable source, unwritable output
    Usage,           // bad command line
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-tag an error from another Result type
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// One discoverable template file. Built once per scan, never mutated after.
struct TemplateEntry {
    std::filesystem::path path;     // root / rel_path
    std::string rel_path;           // "javascript/react.md", '/'-separated, stable id
    std::string title;              // first "# " heading, or the filename stem
    std::string group;              // "javascript" ("" for files directly under root)
    std::string description;        // first prose line, display only
    std::string extends;            // raw "> **Extends:**" line, never resolved
    bool is_base = false;           // filename contains "base"
};

// Ordered result of one scan
struct Catalog {
    std::filesystem::path root;
    std::vector<TemplateEntry> entries;

    bool empty() const { return entries.empty(); }
    size_t size() const { return entries.size(); }

    // nullptr if no entry has this relative path
    const TemplateEntry* find(const std::string& rel_path) const;
};

// One section of the merged output
struct MergedSection {
    const TemplateEntry* entry = nullptr;
    std::string content;            // raw bytes of the file, unmodified
};

struct MergedDocument {
    std::vector<MergedSection> sections;
    std::vector<std::string> sources;   // rel_paths in output order
    std::string text;                   // final concatenated document
};

// ── Configuration structures ────────────────────────────────

struct ScanOptions {
    std::vector<std::string> extensions{".md"};     // compared case-insensitively
    std::vector<std::string> exclude{"README.md"};  // file names, case-insensitive
    bool title_from_heading = true;                 // false: always the filename stem
};

struct MergeOptions {
    bool header = true;                   // "# CLAUDE.md" + generated/sources comments
    std::string document_title = "CLAUDE.md";
    bool base_first = false;              // stable-move [BASE] entries ahead of the rest
};
