#include "selector_state.hpp"

SelectorState::SelectorState(const Catalog& catalog)
    : catalog_(catalog) {}

bool SelectorState::is_selected(size_t index) const {
    if (index >= catalog_.size()) return false;
    return selection_.contains(catalog_.entries[index].rel_path);
}

void SelectorState::handle(Key key) {
    if (done()) return;

    empty_confirm_hint_ = false;
    size_t count = catalog_.size();

    switch (key) {
    case Key::Up:
        move(-1);
        break;
    case Key::Down:
        move(1);
        break;
    case Key::Home:
        cursor_ = 0;
        break;
    case Key::End:
        if (count > 0) cursor_ = count - 1;
        break;
    case Key::Toggle:
        if (count > 0) selection_.toggle(catalog_.entries[cursor_].rel_path);
        break;
    case Key::ToggleAll:
        toggle_all();
        break;
    case Key::Confirm:
        if (selection_.empty()) {
            empty_confirm_hint_ = true;
        } else {
            phase_ = SelectorPhase::Confirmed;
        }
        break;
    case Key::Cancel:
        phase_ = SelectorPhase::Cancelled;
        break;
    case Key::Redraw:
    case Key::Other:
        break;
    }
}

// Wraps at both ends
void SelectorState::move(int delta) {
    size_t count = catalog_.size();
    if (count == 0) return;
    if (delta < 0) {
        cursor_ = (cursor_ == 0) ? count - 1 : cursor_ - 1;
    } else {
        cursor_ = (cursor_ + 1) % count;
    }
}

// Select everything not yet selected (catalog order), or clear if all are selected
void SelectorState::toggle_all() {
    if (catalog_.empty()) return;

    if (selection_.size() == catalog_.size()) {
        selection_.clear();
        return;
    }
    for (const auto& e : catalog_.entries) {
        selection_.add(e.rel_path);
    }
}
