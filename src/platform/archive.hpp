#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Compresses src into dest as a raw gzip stream, the way `gzip -c` would.
// dest is left incomplete on failure.
Result<void> gzip_file(const std::filesystem::path& src, const std::filesystem::path& dest);

} // namespace platform
