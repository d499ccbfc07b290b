#pragma once
#include <cstdint>

namespace cell
{

// QR error-correction levels; the core forwards them to the codec untouched.
enum class Ecc : std::uint8_t
{
    L = 0,  // ~7% recovery
    M = 1,  // ~15%
    Q = 2,  // ~25%
    H = 3   // ~30%
};

}  // namespace cell
