#include <cstring>
#include <endian.h>
#include <limits>
#include <zlib.h>

#include "cell/file_cell_codec.hpp"
#include "util/log.hpp"

namespace cell
{

static constexpr std::uint8_t CELL_MAGIC[4] = {'Q', 'R', 'C', 'L'};

static std::uint32_t crc_of(const Buffer &buf)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!buf.empty())
        crc = crc32(crc, buf.data(), static_cast<uInt>(buf.size()));
    return static_cast<std::uint32_t>(crc);
}

bool FileCellCodec::render(const Buffer &buf, const Hints &h, Image &out)
{
    if (max_ != 0 && buf.size() > max_)
    {
        LOG_ERROR("render: buffer of %zu bytes exceeds cell capacity %zu", buf.size(), max_);
        return false;
    }
    if (buf.size() > std::numeric_limits<uInt>::max())
    {
        LOG_ERROR("render: buffer too large (%zu)", buf.size());
        return false;
    }

    out.resize(CELL_HDR_SIZE + buf.size());
    std::uint8_t *p = out.data();
    std::memcpy(p, CELL_MAGIC, sizeof CELL_MAGIC);
    p[4] = static_cast<std::uint8_t>(h.qr_version);
    p[5] = static_cast<std::uint8_t>(h.ecc);

    const std::uint32_t len_be = htobe32(static_cast<std::uint32_t>(buf.size()));
    std::memcpy(p + 6, &len_be, sizeof len_be);
    const std::uint32_t crc_be = htobe32(crc_of(buf));
    std::memcpy(p + 10, &crc_be, sizeof crc_be);

    if (!buf.empty())
        std::memcpy(p + CELL_HDR_SIZE, buf.data(), buf.size());
    return true;
}

bool FileCellCodec::scan(const Image &img, Buffer &out)
{
    out.clear();
    if (img.size() < CELL_HDR_SIZE || std::memcmp(img.data(), CELL_MAGIC, sizeof CELL_MAGIC) != 0)
    {
        LOG_DEBUG("scan: not a cell (%zu bytes)", img.size());
        return false;
    }
    std::uint32_t len_be, crc_be;
    std::memcpy(&len_be, img.data() + 6, sizeof len_be);
    std::memcpy(&crc_be, img.data() + 10, sizeof crc_be);
    const std::size_t len = be32toh(len_be);
    if (img.size() != CELL_HDR_SIZE + len)
    {
        LOG_DEBUG("scan: length mismatch (got %zu, expect %zu)", img.size(), CELL_HDR_SIZE + len);
        return false;
    }

    Buffer buf(img.begin() + CELL_HDR_SIZE, img.end());
    if (crc_of(buf) != be32toh(crc_be))
    {
        LOG_DEBUG("scan: crc mismatch");
        return false;
    }
    out = std::move(buf);
    return true;
}

}  // namespace cell
