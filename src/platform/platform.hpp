#pragma once

#include <string>
#include <filesystem>

namespace platform {

// HOME, then the password database entry of the current user.
// Empty if neither is available.
std::filesystem::path home_dir();

// Current working directory, or an empty path if it cannot be determined.
std::filesystem::path current_dir();

// True if stdout is attached to a terminal.
bool stdout_is_tty();

} // namespace platform
