#include "platform.hpp"
#include <chrono>
#include <cstdlib>
#include <thread>

#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* env = std::getenv("HOME");
    if (env && *env) return fs::path(env);

    if (const passwd* pw = getpwuid(geteuid())) {
        if (pw->pw_dir && *pw->pw_dir) return fs::path(pw->pw_dir);
    }
    return temp_dir();
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    return ec ? fs::path("/tmp") : p;
}

void sleep_ms(int ms) {
    if (ms <= 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace platform
