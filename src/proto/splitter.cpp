#include <algorithm>

#include "proto/splitter.hpp"
#include "util/log.hpp"

namespace chunk
{

std::size_t count_chunks(std::size_t stream_len, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    if (stream_len == 0)
        return 1;  // metadata-only chunk
    return (stream_len + chunk_size - 1) / chunk_size;
}

std::vector<Chunk> split(const std::vector<std::uint8_t> &stream,
                         std::size_t                      chunk_size,
                         const TransferMeta              &meta)
{
    if (chunk_size == 0 || chunk_size > UINT32_MAX)
    {
        LOG_ERROR("split: invalid chunk_size (%zu)", chunk_size);
        return {};
    }
    const std::size_t num_chunks = count_chunks(stream.size(), chunk_size);
    if (num_chunks > MAX_TOTAL)
    {
        LOG_ERROR("split: stream too large (%zu bytes, needs %zu chunks)", stream.size(),
                  num_chunks);
        return {};
    }

    Header base;
    base.ver           = WIRE_VER;
    base.flags         = meta.compressed ? FLAG_COMPRESSED : 0;
    base.id            = meta.id;
    base.id.filename   = wire_filename(meta.id.filename);
    base.total         = static_cast<std::uint32_t>(num_chunks);
    base.original_size = meta.original_size;

    std::vector<Chunk> out;
    out.reserve(num_chunks);
    for (std::size_t i = 0; i < num_chunks; i++)
    {
        const std::size_t start = i * chunk_size;
        const std::size_t take  = stream.empty() ? 0 : std::min(chunk_size, stream.size() - start);
        Chunk             c;
        c.hdr       = base;
        c.hdr.index = static_cast<std::uint32_t>(i);
        c.hdr.len   = static_cast<std::uint32_t>(take);
        if (take)
            c.payload.assign(stream.begin() + start, stream.begin() + start + take);
        out.push_back(std::move(c));
    }
    LOG_DEBUG("split: %zu bytes -> %zu chunks of <= %zu", stream.size(), num_chunks, chunk_size);
    return out;
}

}  // namespace chunk
