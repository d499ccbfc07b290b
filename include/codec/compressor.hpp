#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "proto/errors.hpp"

namespace compressor
{

inline constexpr int EFFORT_NONE = 0;  // passthrough, stream tagged uncompressed
inline constexpr int EFFORT_MAX  = 9;

struct Compressed
{
    bool                      compressed{false};
    std::vector<std::uint8_t> data;
};

// Deflate (zlib format) at the given effort. Effort 0 copies the input through
// and tags it uncompressed. Returns false for an effort outside 0..9.
bool compress(const std::vector<std::uint8_t> &in, int effort, Compressed &out);

// Inverse of compress() for a tagged-compressed stream. `expected_size` is the
// original length carried in the chunk header and bounds the output.
// Returns Error::CorruptStream if zlib rejects the stream or the length differs.
proto::Error decompress(const std::vector<std::uint8_t> &in,
                        std::uint64_t                    expected_size,
                        std::vector<std::uint8_t>       &out);

}  // namespace compressor
