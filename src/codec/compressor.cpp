#include <limits>
#include <utility>
#include <zlib.h>

#include "codec/compressor.hpp"
#include "util/log.hpp"

namespace compressor
{

static constexpr std::size_t INFLATE_STEP = 16 * 1024;

bool compress(const std::vector<std::uint8_t> &in, int effort, Compressed &out)
{
    if (effort < EFFORT_NONE || effort > EFFORT_MAX)
    {
        LOG_ERROR("compress: invalid effort (%d), expected %d..%d", effort, EFFORT_NONE,
                  EFFORT_MAX);
        return false;
    }
    if (effort == EFFORT_NONE)
    {
        out.compressed = false;
        out.data       = in;
        return true;
    }
    if (in.size() > static_cast<std::size_t>(std::numeric_limits<uLong>::max()))
    {
        LOG_ERROR("compress: input too large (%zu bytes)", in.size());
        return false;
    }

    const uLong               src_len = static_cast<uLong>(in.size());
    uLongf                    out_len = compressBound(src_len);
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(out_len));

    const int status = compress2(buf.data(), &out_len, in.data(), src_len, effort);
    if (status != Z_OK)
    {
        LOG_ERROR("compress: compress2 failed (%d)", status);
        return false;
    }
    buf.resize(static_cast<std::size_t>(out_len));
    LOG_DEBUG("compress: %zu -> %zu bytes (effort %d)", in.size(), buf.size(), effort);

    out.compressed = true;
    out.data       = std::move(buf);
    return true;
}

proto::Error decompress(const std::vector<std::uint8_t> &in,
                        std::uint64_t                    expected_size,
                        std::vector<std::uint8_t>       &out)
{
    out.clear();
    if (in.empty())
    {
        LOG_ERROR("decompress: empty stream");
        return proto::Error::CorruptStream;
    }
    if (in.size() > static_cast<std::size_t>(std::numeric_limits<uInt>::max()))
    {
        LOG_ERROR("decompress: stream too large (%zu bytes)", in.size());
        return proto::Error::CorruptStream;
    }

    z_stream zs{};
    if (inflateInit(&zs) != Z_OK)
    {
        LOG_ERROR("decompress: inflateInit failed");
        return proto::Error::CorruptStream;
    }
    zs.next_in  = const_cast<Bytef *>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());

    // The header's size is untrusted: grow with the output instead of
    // allocating it up front, and stop as soon as the output passes it.
    std::vector<std::uint8_t> buf;
    std::uint8_t              step[INFLATE_STEP];
    int                       status = Z_OK;
    while (status == Z_OK)
    {
        zs.next_out  = step;
        zs.avail_out = sizeof step;
        status       = inflate(&zs, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END)
            break;

        const std::size_t produced = sizeof step - zs.avail_out;
        if (static_cast<std::uint64_t>(buf.size()) + produced > expected_size)
        {
            LOG_ERROR("decompress: output exceeds expected %llu bytes",
                      static_cast<unsigned long long>(expected_size));
            inflateEnd(&zs);
            return proto::Error::CorruptStream;
        }
        buf.insert(buf.end(), step, step + produced);
        if (status == Z_OK && produced == 0 && zs.avail_in == 0)
        {
            status = Z_BUF_ERROR;  // input ran out before the end of the stream
            break;
        }
    }
    const uInt trailing = zs.avail_in;
    inflateEnd(&zs);

    if (status != Z_STREAM_END)
    {
        LOG_ERROR("decompress: inflate failed (%d: %s)", status,
                  status == Z_DATA_ERROR  ? "bad data"
                  : status == Z_BUF_ERROR ? "truncated"
                                          : "other");
        return proto::Error::CorruptStream;
    }
    if (trailing != 0)
    {
        LOG_ERROR("decompress: %u stray byte(s) after end of stream", trailing);
        return proto::Error::CorruptStream;
    }
    if (static_cast<std::uint64_t>(buf.size()) != expected_size)
    {
        LOG_ERROR("decompress: size mismatch (got %zu, expect %llu)", buf.size(),
                  static_cast<unsigned long long>(expected_size));
        return proto::Error::CorruptStream;
    }
    out = std::move(buf);
    return proto::Error::None;
}

}  // namespace compressor
