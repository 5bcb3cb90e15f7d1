#include "platform.hpp"
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

fs::path expand_home(const std::string& path) {
    if (path == "~") return home_dir();
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return home_dir() / path.substr(2);
    }
    return fs::path(path);
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    usleep(static_cast<useconds_t>(ms) * 1000);
}

} // namespace platform
