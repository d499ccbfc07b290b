#include <cstdint>
#include <cstring>
#include <endian.h>  // htobe32, be32toh, htobe64, be64toh

#include "proto/chunk.hpp"
#include "util/log.hpp"

namespace chunk
{

const char *failure_name(ParseFailure f)
{
    switch (f)
    {
        case ParseFailure::None:
            return "none";
        case ParseFailure::TooShort:
            return "too-short";
        case ParseFailure::BadMagic:
            return "bad-magic";
        case ParseFailure::BadVersion:
            return "bad-version";
        case ParseFailure::BadFilename:
            return "bad-filename";
        case ParseFailure::ZeroTotal:
            return "zero-total";
        case ParseFailure::IndexOutOfRange:
            return "index-out-of-range";
        case ParseFailure::LengthMismatch:
            return "length-mismatch";
    }
    return "?";
}

std::string wire_filename(const std::string &name)
{
    if (name.size() <= MAX_FILENAME)
        return name;
    std::size_t cut = MAX_FILENAME;
    // back off continuation bytes (10xxxxxx) so the cut lands on a code point boundary
    while (cut > 0 && (static_cast<unsigned char>(name[cut]) & 0xC0) == 0x80)
        --cut;
    return name.substr(0, cut);
}

std::size_t header_size(const Header &h)
{
    return FIXED_HDR_SIZE + h.id.filename.size() + TAIL_HDR_SIZE;
}

static bool header_ok(const Header &h)
{
    if (h.ver != WIRE_VER)
        return false;
    if (h.total == 0)
        return false;
    if (h.index >= h.total)
        return false;
    if (h.id.filename.size() > MAX_FILENAME)
        return false;
    return true;
}

static void put_u32(std::uint8_t *p, std::uint32_t v)
{
    const std::uint32_t be = htobe32(v);
    std::memcpy(p, &be, sizeof be);
}

static void put_u64(std::uint8_t *p, std::uint64_t v)
{
    const std::uint64_t be = htobe64(v);
    std::memcpy(p, &be, sizeof be);
}

static std::uint32_t get_u32(const std::uint8_t *p)
{
    std::uint32_t be;
    std::memcpy(&be, p, sizeof be);
    return be32toh(be);
}

static std::uint64_t get_u64(const std::uint8_t *p)
{
    std::uint64_t be;
    std::memcpy(&be, p, sizeof be);
    return be64toh(be);
}

std::vector<std::uint8_t> serialize(const Chunk &c)
{
    if (c.payload.size() != c.hdr.len)
    {
        LOG_ERROR("serialize: payload size mismatch (%zu != %u)", c.payload.size(),
                  static_cast<unsigned>(c.hdr.len));
        return {};
    }
    if (!header_ok(c.hdr))
    {
        LOG_ERROR("serialize: invalid header (index=%u, total=%u, name_len=%zu)", c.hdr.index,
                  c.hdr.total, c.hdr.id.filename.size());
        return {};
    }

    const std::size_t         name_len = c.hdr.id.filename.size();
    std::vector<std::uint8_t> out(header_size(c.hdr) + c.payload.size());
    std::uint8_t             *p = out.data();

    std::memcpy(p, MAGIC, sizeof MAGIC);
    p[3] = c.hdr.ver;
    std::memcpy(p + 4, c.hdr.id.digest.data(), digest::DIGEST_SIZE);
    put_u32(p + 36, c.hdr.index);
    put_u32(p + 40, c.hdr.total);
    put_u64(p + 44, c.hdr.original_size);
    p[52] = static_cast<std::uint8_t>(name_len);
    if (name_len)
        std::memcpy(p + FIXED_HDR_SIZE, c.hdr.id.filename.data(), name_len);

    p += FIXED_HDR_SIZE + name_len;
    p[0] = c.hdr.flags & FLAG_COMPRESSED;  // reserved bits stay zero
    put_u32(p + 1, c.hdr.len);

    if (!c.payload.empty())
        std::memcpy(p + TAIL_HDR_SIZE, c.payload.data(), c.payload.size());
    return out;
}

std::optional<Chunk> parse(const std::vector<std::uint8_t> &buf, ParseFailure *why)
{
    auto reject = [&](ParseFailure f) -> std::optional<Chunk> {
        if (why)
            *why = f;
        return std::nullopt;
    };
    if (why)
        *why = ParseFailure::None;

    if (buf.size() < MIN_WIRE_SIZE)
    {
        LOG_DEBUG("parse: buffer too short (%zu)", buf.size());
        return reject(ParseFailure::TooShort);
    }
    const std::uint8_t *p = buf.data();
    if (std::memcmp(p, MAGIC, sizeof MAGIC) != 0)
    {
        LOG_DEBUG("parse: bad magic");
        return reject(ParseFailure::BadMagic);
    }

    Chunk   c;
    Header &h = c.hdr;
    h.ver     = p[3];
    if (h.ver != WIRE_VER)
    {
        LOG_DEBUG("parse: unsupported version %u", static_cast<unsigned>(h.ver));
        return reject(ParseFailure::BadVersion);
    }
    std::memcpy(h.id.digest.data(), p + 4, digest::DIGEST_SIZE);
    h.index         = get_u32(p + 36);
    h.total         = get_u32(p + 40);
    h.original_size = get_u64(p + 44);

    const std::size_t name_len = p[52];
    if (name_len > MAX_FILENAME)
    {
        LOG_DEBUG("parse: filename length %zu over bound", name_len);
        return reject(ParseFailure::BadFilename);
    }
    if (buf.size() < MIN_WIRE_SIZE + name_len)
    {
        LOG_DEBUG("parse: header truncated (%zu < %zu)", buf.size(), MIN_WIRE_SIZE + name_len);
        return reject(ParseFailure::TooShort);
    }
    h.id.filename.assign(reinterpret_cast<const char *>(p + FIXED_HDR_SIZE), name_len);

    if (h.total == 0)
    {
        LOG_DEBUG("parse: zero total");
        return reject(ParseFailure::ZeroTotal);
    }
    if (h.index >= h.total)
    {
        LOG_DEBUG("parse: index %u >= total %u", h.index, h.total);
        return reject(ParseFailure::IndexOutOfRange);
    }

    const std::uint8_t *tail = p + FIXED_HDR_SIZE + name_len;
    h.flags                  = tail[0];
    h.len                    = get_u32(tail + 1);

    const std::size_t hdr      = MIN_WIRE_SIZE + name_len;
    const std::size_t expected = hdr + static_cast<std::size_t>(h.len);
    if (buf.size() != expected)
    {
        LOG_DEBUG("parse: size mismatch (got %zu, expect %zu)", buf.size(), expected);
        return reject(ParseFailure::LengthMismatch);
    }
    if (h.len)
        c.payload.assign(buf.begin() + hdr, buf.end());
    return c;
}

}  // namespace chunk
