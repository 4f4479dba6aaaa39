#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* PROMPT_MERGE_VERSION = "0.3.0";

// ── Exit codes ──────────────────────────────────────────────
// PM_ prefix keeps clear of the EXIT_SUCCESS/EXIT_FAILURE macros
constexpr int PM_EXIT_OK             = 0;   // success, list, help, or user cancelled
constexpr int PM_EXIT_INTERNAL       = 1;   // unexpected exception escaping main
constexpr int PM_EXIT_USAGE          = 2;   // unknown flag, missing option value
constexpr int PM_EXIT_CONFIG_ERROR   = 3;   // bad or missing root, malformed config
constexpr int PM_EXIT_IO_ERROR       = 4;   // unreadable source, unwritable output
constexpr int PM_EXIT_VALIDATION     = 5;   // duplicate, unknown or empty selection

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_OUTPUT         = "CLAUDE.md";
constexpr const char* DEFAULT_TEMPLATES_DIR  = "templates";
constexpr const char* DEFAULT_EXTENSION      = ".md";
constexpr const char* DEFAULT_EXCLUDE        = "README.md";
constexpr const char* DEFAULT_DOC_TITLE      = "CLAUDE.md";
constexpr const char* STDOUT_PATH            = "-";

// ── Config locations ────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR      = ".prompt-merge";
constexpr const char* CONFIG_FILENAME        = "config.yaml";
constexpr const char* PROJECT_CONFIG_FILE    = "prompt-merge.yaml";

// ── Scanner ─────────────────────────────────────────────────
constexpr int HEADER_SCAN_LINES          = 10;    // lines inspected for title/description
constexpr int DESCRIPTION_MAX_CHARS      = 80;
constexpr const char* EXTENDS_PREFIX     = "> **Extends:**";

// ── Merged document markers ─────────────────────────────────
// Use fmt::format with these: fmt::format(SOURCE_MARKER, rel_path)
constexpr const char* SOURCE_MARKER      = "<!-- prompt-merge:source {} -->";
constexpr const char* GENERATED_MARKER   = "<!-- Generated by prompt-merge -->";
constexpr const char* SOURCES_MARKER     = "<!-- Sources: {} -->";

// ── Selector ────────────────────────────────────────────────
constexpr int ESC_SEQUENCE_TIMEOUT_MS    = 50;    // bare-Esc vs escape-sequence window
constexpr int SELECTOR_CHROME_ROWS       = 8;     // title, blanks, more-above/below, footer, hint
constexpr int ROWS_PER_ENTRY             = 2;     // path line + title line
