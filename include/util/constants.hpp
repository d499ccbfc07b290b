#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
inline constexpr std::string_view VERSION    = "1.0.0";
inline constexpr std::string_view CELL_EXT   = ".qrc";
inline constexpr std::size_t      MAX_CHUNK  = 10 * 1024 * 1024;  // 10 MiB
inline constexpr std::size_t      MIN_CHUNK  = 1;
inline constexpr int              MIN_QR_VER = 1;
inline constexpr int              MAX_QR_VER = 40;
inline constexpr int              MAX_EFFORT = 9;

// Fraction of the original size assumed by a quick estimate when compressing.
inline constexpr double ESTIMATE_RATIO = 0.7;

// Output directory for encoded cells and decoded files
[[maybe_unused]] static std::string output_dir()
{
    if (const char *p = std::getenv("QRARE_OUT_DIR"); p && *p)
    {
        return std::string(p);
    }
    // fallback to default
    std::string dir = "./qrare-out";
    LOG_DEBUG("QRARE_OUT_DIR not set, using %s", dir.c_str());
    return dir;
}

}  // namespace constants
