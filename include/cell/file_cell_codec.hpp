#pragma once
#include <cstddef>
#include <cstdint>

#include "cell/icell_codec.hpp"

namespace cell
{

/*
 FileCellCodec: byte-exact stand-in for a QR image codec. A cell is
   "QRCL" | u8 qr_version | u8 ecc | u32 length | u32 crc32 | buffer
 (big-endian). scan() rejects bad magic, bad length or a CRC mismatch the
 way a real scanner rejects an unreadable symbol.
*/
class FileCellCodec final : public ICellCodec
{
  public:
    static constexpr std::size_t CELL_HDR_SIZE = 14;

    explicit FileCellCodec(std::size_t max_buffer = 0) : max_(max_buffer) {}

    bool        render(const Buffer &buf, const Hints &h, Image &out) override;
    bool        scan(const Image &img, Buffer &out) override;
    std::string name() const override { return "file"; }
    std::size_t max_buffer() const override { return max_; }

  private:
    std::size_t max_{0};
};

}  // namespace cell
