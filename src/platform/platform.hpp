#pragma once

#include <filesystem>

namespace platform {

// $HOME, else the passwd entry of the current user, else the temp dir.
std::filesystem::path home_dir();

std::filesystem::path temp_dir();

void sleep_ms(int ms);

} // namespace platform
