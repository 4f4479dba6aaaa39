#pragma once

namespace platform {

// Terminal dimensions. The selector UI draws on stderr, so that is the
// stream measured; stdout stays free for merged output.
int term_width();
int term_height();

// RAII guard for raw keyboard input.
// Constructor saves the current mode and turns off canonical input, echo,
// signal keys and flow control, so every keypress (Ctrl+C included) arrives
// as a byte. Output processing is left alone.
// Destructor restores the saved mode. SIGINT, SIGTERM, SIGHUP and SIGQUIT
// restore it too before the signal's default action runs.
struct RawModeGuard {
    // alt_screen: also switch stderr's terminal to the alternate screen with
    // a hidden cursor
    explicit RawModeGuard(bool alt_screen = false);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    // False if stdin is not a terminal and nothing was changed
    bool active() const { return active_; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
    bool active_ = false;
};

// Return values of read_stdin_byte besides 0..255
constexpr int kReadTimeout = -2;
constexpr int kReadEof = -1;
constexpr int kReadInterrupted = -3;

// Read one byte from stdin. timeout_ms < 0 blocks.
// Returns kReadInterrupted when a signal (e.g. resize) cut the wait short.
int read_stdin_byte(int timeout_ms);

// SIGWINCH watch. Interrupted reads are not restarted, so a blocked
// read_stdin_byte returns kReadInterrupted when the window is resized.
void watch_terminal_resize();
void unwatch_terminal_resize();

} // namespace platform
