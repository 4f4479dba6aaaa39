#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Directory holding the running executable, if it can be determined.
std::optional<std::filesystem::path> executable_dir();

// True if the stream is attached to a terminal.
bool stdin_is_tty();
bool stdout_is_tty();
bool stderr_is_tty();

} // namespace platform
