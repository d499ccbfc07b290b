#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "proto/chunk.hpp"

namespace chunk
{

// Per-transfer fields stamped into every chunk.
struct TransferMeta
{
    TransferId    id;
    std::uint64_t original_size{0};
    bool          compressed{false};
};

// Partition `stream` into max(1, ceil(len / chunk_size)) chunks in stream order.
// Empty on chunk_size == 0 or a chunk count that does not fit the wire field.
std::vector<Chunk> split(const std::vector<std::uint8_t> &stream,
                         std::size_t                      chunk_size,
                         const TransferMeta              &meta);

// Chunk count split() would produce, 0 when chunk_size == 0.
std::size_t count_chunks(std::size_t stream_len, std::size_t chunk_size);

}  // namespace chunk
