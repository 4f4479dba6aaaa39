#pragma once

#include <string>
#include "selector_state.hpp"

// Byte-level input used by the key decoder
class ByteReader {
public:
    virtual ~ByteReader() = default;

    // One byte (0..255), or platform::kReadTimeout / kReadEof / kReadInterrupted.
    // timeout_ms < 0 blocks.
    virtual int read_byte(int timeout_ms) = 0;
};

// Reads one keypress worth of bytes and maps it to a Key.
//
//   Up / k           Up          Down / j        Down
//   Home / g         Home        End / G         End
//   Space            Toggle      a               ToggleAll
//   Enter (\r, \n)   Confirm
//   q, Esc, Ctrl+C, Ctrl+D, end of input         Cancel
//
// Arrow, Home and End arrive as "ESC [ x", "ESC O x" or "ESC [ n ~".
// A lone ESC (nothing follows within the timeout) is Cancel.
Key decode_key(ByteReader& in);

// Source of decoded keys for the selector session
class KeySource {
public:
    virtual ~KeySource() = default;
    virtual Key next_key() = 0;
};

// Keys from the process's stdin. Expects the terminal to be in raw mode.
class TerminalKeySource : public KeySource {
public:
    Key next_key() override;

private:
    class StdinReader : public ByteReader {
    public:
        int read_byte(int timeout_ms) override;
    };
    StdinReader reader_;
};
