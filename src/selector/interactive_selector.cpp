#include "interactive_selector.hpp"
#include <cli/theme.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

// Cut plain text to `width` bytes without splitting a UTF-8 sequence
static std::string fit(const std::string& s, int width) {
    if (width <= 0) return "";
    if (s.size() <= static_cast<size_t>(width)) return s;
    size_t cut = static_cast<size_t>(width);
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) cut--;
    return s.substr(0, cut);
}

size_t viewport_start(size_t cursor, size_t count, size_t visible) {
    if (visible == 0 || count <= visible) return 0;
    size_t start = cursor >= visible / 2 ? cursor - visible / 2 : 0;
    if (start + visible > count) start = count - visible;
    return start;
}

std::string render_selector(const SelectorState& state, int rows, int cols) {
    const auto& entries = state.catalog().entries;
    size_t count = entries.size();

    size_t visible = static_cast<size_t>(
        std::max(1, (rows - SELECTOR_CHROME_ROWS) / ROWS_PER_ENTRY));
    size_t start = viewport_start(state.cursor(), count, visible);
    size_t end = std::min(count, start + visible);

    std::string out;
    out.reserve(256 + end * 96);
    out += "\033[H\033[J";

    out += theme::bold(fit("Select templates to merge", cols)) + "\n";
    out += theme::dim(fit("  space toggle  a all  j/k or arrows move  enter confirm  q quit", cols)) + "\n";

    out += start > 0 ? theme::dim(fmt::format("  ... {} more above", start)) + "\n" : "\n";

    for (size_t i = start; i < end; i++) {
        const auto& e = entries[i];
        bool here = (i == state.cursor());
        bool selected = state.is_selected(i);

        std::string line = fmt::format(" {} {} {}", here ? ">" : " ",
                                       selected ? "[x]" : "[ ]", e.rel_path);
        if (e.is_base) line += " [BASE]";
        if (selected) line += fmt::format("  #{}", state.selection().position(e.rel_path));
        line = fit(line, cols);

        if (here) {
            out += theme::paint(theme::color::BLUE + theme::color::BOLD, line) + "\n";
        } else if (selected) {
            out += theme::green(line) + "\n";
        } else {
            out += line + "\n";
        }
        out += theme::dim(fit("       " + e.title, cols)) + "\n";
    }

    out += end < count ? theme::dim(fmt::format("  ... {} more below", count - end)) + "\n" : "\n";

    out += fmt::format("\n{} template(s) selected", state.selection().size());
    out += "\n";
    if (state.empty_confirm_hint()) {
        out += theme::yellow(fit("Select at least one template before confirming.", cols)) + "\n";
    }
    return out;
}

InteractiveSelector::InteractiveSelector(const Catalog& catalog)
    : catalog_(catalog) {}

std::optional<SelectionSet> InteractiveSelector::run(KeySource& keys, std::ostream& out,
                                                     int rows, int cols) {
    SelectorState state(catalog_);

    while (!state.done()) {
        int r = rows > 0 ? rows : platform::term_height();
        int c = cols > 0 ? cols : platform::term_width();
        out << render_selector(state, r, c) << std::flush;

        state.handle(keys.next_key());
    }

    if (state.phase() == SelectorPhase::Cancelled) {
        pmerge_log("selector: cancelled");
        return std::nullopt;
    }

    pmerge_log(fmt::format("selector: confirmed {} template(s)", state.selection().size()));
    return state.selection();
}

namespace {

// SIGWINCH handler installed for the session only
struct ResizeWatch {
    ResizeWatch() { platform::watch_terminal_resize(); }
    ~ResizeWatch() { platform::unwatch_terminal_resize(); }
    ResizeWatch(const ResizeWatch&) = delete;
    ResizeWatch& operator=(const ResizeWatch&) = delete;
};

} // namespace

Result<std::optional<SelectionSet>> InteractiveSelector::run() {
    using R = Result<std::optional<SelectionSet>>;

    if (!platform::stdin_is_tty() || !platform::stderr_is_tty()) {
        return R::Err(ErrorKind::Configuration,
                      "Interactive selection requires a terminal; use --select for non-interactive mode");
    }

    theme::StderrColor color;
    std::optional<SelectionSet> selection;
    {
        platform::RawModeGuard guard(true);
        if (!guard.active()) {
            return R::Err(ErrorKind::Configuration, "Could not switch the terminal to raw mode");
        }
        ResizeWatch resize;
        TerminalKeySource keys;
        selection = run(keys, std::cerr);
    }

    if (!selection) {
        std::cerr << theme::dim("Cancelled.") << "\n";
    }
    return R::Ok(selection);
}
