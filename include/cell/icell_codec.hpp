#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "cell/ecc.hpp"

namespace cell
{

using Buffer = std::vector<std::uint8_t>;
using Image  = std::vector<std::uint8_t>;  // encoded cell, opaque to the core

// Density and error-correction hints, forwarded untouched.
struct Hints
{
    int qr_version = 40;
    Ecc ecc        = Ecc::H;
};

// Turns one bounded wire buffer into a scannable cell and back. The codec does
// its own error correction; scan() returning false is a ScanFailure.
struct ICellCodec
{
    virtual bool        render(const Buffer &buf, const Hints &h, Image &out) = 0;
    virtual bool        scan(const Image &img, Buffer &out)                   = 0;
    virtual std::string name() const { return ""; }
    virtual std::size_t max_buffer() const { return 0; }  // 0 = unbounded
    virtual ~ICellCodec() = default;
};

}  // namespace cell
