#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <cerrno>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width() {
    struct winsize ws;
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height() {
    struct winsize ws;
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

// ── Signal-time restore ──────────────────────────────────────
// Only async-signal-safe calls (tcsetattr, write, raise) in the handler.

static const char kEnterAlt[] = "\033[?1049h\033[?25l\033[H";
static const char kLeaveAlt[] = "\033[?25h\033[?1049l";

static struct termios g_saved_term;
static volatile sig_atomic_t g_restore_armed = 0;
static volatile sig_atomic_t g_alt_screen = 0;

static const int kRestoreSignals[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};
constexpr int kRestoreSignalCount = sizeof(kRestoreSignals) / sizeof(kRestoreSignals[0]);

static void restore_and_reraise(int sig) {
    if (g_restore_armed) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &g_saved_term);
        if (g_alt_screen) {
            ssize_t n = write(STDERR_FILENO, kLeaveAlt, sizeof(kLeaveAlt) - 1);
            (void)n;
        }
        g_restore_armed = 0;
    }
    // SA_RESETHAND put the default action back; it runs once we return
    raise(sig);
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
    struct sigaction old_actions[kRestoreSignalCount];
    bool alt_screen = false;
};

RawModeGuard::RawModeGuard(bool alt_screen) {
    if (!isatty(STDIN_FILENO)) return;

    impl_ = new Impl;
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) {
        delete impl_;
        impl_ = nullptr;
        return;
    }

    g_saved_term = impl_->old_term;
    g_alt_screen = alt_screen ? 1 : 0;
    g_restore_armed = 1;

    struct sigaction sa;
    sa.sa_handler = restore_and_reraise;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESETHAND;
    for (int i = 0; i < kRestoreSignalCount; i++) {
        sigaction(kRestoreSignals[i], &sa, &impl_->old_actions[i]);
    }

    struct termios raw = impl_->old_term;
    raw.c_lflag &= ~(ICANON | ECHO | ISIG | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        g_restore_armed = 0;
        for (int i = 0; i < kRestoreSignalCount; i++) {
            sigaction(kRestoreSignals[i], &impl_->old_actions[i], nullptr);
        }
        delete impl_;
        impl_ = nullptr;
        return;
    }

    if (alt_screen) {
        ssize_t n = write(STDERR_FILENO, kEnterAlt, sizeof(kEnterAlt) - 1);
        (void)n;
        impl_->alt_screen = true;
    }
    active_ = true;
}

RawModeGuard::~RawModeGuard() {
    if (!impl_) return;

    if (impl_->alt_screen) {
        ssize_t n = write(STDERR_FILENO, kLeaveAlt, sizeof(kLeaveAlt) - 1);
        (void)n;
    }
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
    g_restore_armed = 0;

    for (int i = 0; i < kRestoreSignalCount; i++) {
        sigaction(kRestoreSignals[i], &impl_->old_actions[i], nullptr);
    }
    delete impl_;
}

// ── stdin reads ──────────────────────────────────────────────

int read_stdin_byte(int timeout_ms) {
    if (timeout_ms >= 0) {
        struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
        int rc = poll(&pfd, 1, timeout_ms);
        if (rc < 0) return errno == EINTR ? kReadInterrupted : kReadEof;
        if (rc == 0) return kReadTimeout;
    }

    unsigned char c;
    ssize_t n = read(STDIN_FILENO, &c, 1);
    if (n == 1) return c;
    if (n < 0 && errno == EINTR) return kReadInterrupted;
    return kReadEof;
}

// ── Resize tracking ──────────────────────────────────────────

static struct sigaction g_old_winch;

// Exists only to interrupt the blocked read
static void sigwinch_handler(int) {}

void watch_terminal_resize() {
    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: blocked reads return EINTR
    sigaction(SIGWINCH, &sa, &g_old_winch);
}

void unwatch_terminal_resize() {
    sigaction(SIGWINCH, &g_old_winch, nullptr);
}

} // namespace platform
