#pragma once

#include <string>
#include <optional>
#include <ostream>
#include <core/types.hpp>
#include "selection_set.hpp"
#include "selector_state.hpp"
#include "key_input.hpp"

// Terminal checklist over the catalog.
//
// The session is single-threaded and blocks on key input between redraws.
// The terminal's raw mode is owned by the session for its whole duration
// and restored on every exit path.
class InteractiveSelector {
public:
    explicit InteractiveSelector(const Catalog& catalog);

    // Takes over the terminal (keys from stdin, frames on stderr). Returns the
    // selection on confirm, nullopt when the user cancels. Configuration
    // error if stdin or stderr is not a terminal.
    Result<std::optional<SelectionSet>> run();

    // Drives the session from any key source, drawing frames to `out`.
    // rows/cols <= 0 re-measure the terminal before every frame.
    std::optional<SelectionSet> run(KeySource& keys, std::ostream& out,
                                    int rows = 0, int cols = 0);

private:
    const Catalog& catalog_;
};

// One full frame for the current state. Clears the screen first.
// `rows` and `cols` are the terminal size; the entry list scrolls so the
// cursor is always visible.
std::string render_selector(const SelectorState& state, int rows, int cols);

// Index of the first entry shown so `cursor` stays on screen
size_t viewport_start(size_t cursor, size_t count, size_t visible);
