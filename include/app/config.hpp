#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "cell/ecc.hpp"

namespace app
{

using Ecc = cell::Ecc;

struct Config
{
    std::size_t chunk_size    = 1024;
    int         effort        = 9;  // 0 = passthrough .. 9 = strongest
    int         qr_version    = 40;
    Ecc         ecc           = Ecc::H;
    std::size_t cell_capacity = 0;  // max wire buffer per cell, 0 = unchecked
};

// Presets. `chunk_size` of 0 keeps the preset's own value.
Config fast_config(std::size_t chunk_size = 0);
Config compact_config(std::size_t chunk_size = 0);
Config robust_config(std::size_t chunk_size = 0);
std::optional<Config> preset_by_name(std::string_view name, std::size_t chunk_size = 0);

// Logs every violated bound and returns false if any.
bool validate(const Config &c);

// Override fields from QRARE_CHUNK_SIZE, QRARE_EFFORT, QRARE_QR_VERSION,
// QRARE_ECC, QRARE_CELL_CAPACITY. Unparsable values are logged and ignored.
void apply_env(Config &c);

const char         *ecc_name(Ecc e);
std::optional<Ecc> parse_ecc(std::string_view s);

// e.g. "chunk=1024 effort=9 version=40 ecc=H capacity=unchecked"
std::string summary(const Config &c);

}  // namespace app
