#include "key_input.hpp"
#include <core/constants.hpp>
#include <platform/terminal.hpp>

// Final byte of an escape sequence
static Key decode_sequence_final(int c) {
    switch (c) {
    case 'A': return Key::Up;
    case 'B': return Key::Down;
    case 'H': return Key::Home;
    case 'F': return Key::End;
    default:  return Key::Other;
    }
}

// "ESC [ 1 ~" / "ESC [ 7 ~" Home, "ESC [ 4 ~" / "ESC [ 8 ~" End
static Key decode_tilde_code(int code) {
    switch (code) {
    case 1: case 7: return Key::Home;
    case 4: case 8: return Key::End;
    default:        return Key::Other;
    }
}

static Key decode_escape(ByteReader& in) {
    int c = in.read_byte(ESC_SEQUENCE_TIMEOUT_MS);
    if (c == platform::kReadTimeout || c == platform::kReadEof) return Key::Cancel;
    if (c == platform::kReadInterrupted) return Key::Redraw;

    if (c == 'O') {
        int f = in.read_byte(ESC_SEQUENCE_TIMEOUT_MS);
        return f < 0 ? Key::Other : decode_sequence_final(f);
    }
    if (c != '[') return Key::Other;

    int code = 0;
    for (;;) {
        int f = in.read_byte(ESC_SEQUENCE_TIMEOUT_MS);
        if (f < 0) return Key::Other;
        if (f >= '0' && f <= '9') {
            // Only 1..8 mean anything; stop growing so long runs cannot overflow
            if (code < 10000) code = code * 10 + (f - '0');
            continue;
        }
        if (f == ';') continue;  // modifier parameters, ignored
        if (f == '~') return decode_tilde_code(code);
        return decode_sequence_final(f);
    }
}

Key decode_key(ByteReader& in) {
    int c = in.read_byte(-1);

    if (c == platform::kReadEof) return Key::Cancel;
    if (c == platform::kReadInterrupted || c == platform::kReadTimeout) return Key::Redraw;

    switch (c) {
    case 0x1b:      return decode_escape(in);
    case 'k':       return Key::Up;
    case 'j':       return Key::Down;
    case 'g':       return Key::Home;
    case 'G':       return Key::End;
    case ' ':       return Key::Toggle;
    case 'a':       return Key::ToggleAll;
    case '\r':
    case '\n':      return Key::Confirm;
    case 'q':
    case 0x03:      // Ctrl+C
    case 0x04:      // Ctrl+D
                    return Key::Cancel;
    default:        return Key::Other;
    }
}

int TerminalKeySource::StdinReader::read_byte(int timeout_ms) {
    return platform::read_stdin_byte(timeout_ms);
}

Key TerminalKeySource::next_key() {
    return decode_key(reader_);
}
