#pragma once

#include <string>
#include <core/types.hpp>
#include "selection_set.hpp"

// Decoded key events the selector understands
enum class Key {
    Up,
    Down,
    Home,
    End,
    Toggle,
    ToggleAll,
    Confirm,
    Cancel,
    Redraw,     // terminal resized, nothing else changed
    Other,
};

enum class SelectorPhase {
    Browsing,
    Confirmed,   // terminal
    Cancelled,   // terminal
};

// Selection state machine, independent of any terminal.
//
// Browsing -> Browsing   on navigation / toggle
// Browsing -> Confirmed  on Confirm, only with a non-empty selection
// Browsing -> Cancelled  on Cancel
// Keys arriving in a terminal phase are ignored.
class SelectorState {
public:
    explicit SelectorState(const Catalog& catalog);

    void handle(Key key);

    SelectorPhase phase() const { return phase_; }
    bool done() const { return phase_ != SelectorPhase::Browsing; }

    size_t cursor() const { return cursor_; }
    const SelectionSet& selection() const { return selection_; }
    const Catalog& catalog() const { return catalog_; }

    bool is_selected(size_t index) const;

    // Set when Confirm was pressed with nothing selected; cleared by the next key
    bool empty_confirm_hint() const { return empty_confirm_hint_; }

private:
    const Catalog& catalog_;
    SelectorPhase phase_ = SelectorPhase::Browsing;
    size_t cursor_ = 0;
    SelectionSet selection_;
    bool empty_confirm_hint_ = false;

    void move(int delta);
    void toggle_all();
};
