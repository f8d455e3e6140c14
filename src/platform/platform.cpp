#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return fs::path();
}

fs::path current_dir() {
    std::error_code ec;
    auto p = fs::current_path(ec);
    if (ec) return fs::path();
    return p;
}

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) != 0;
}

} // namespace platform
