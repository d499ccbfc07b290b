#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "crypto/digest.hpp"

/*
ENCODE:
pipeline.encode(file_bytes, name, cfg)
  -> digest::compute(file_bytes)                     // transfer identity
  -> compressor::compress(file_bytes, effort)
     -> chunk::split(stream, chunk_size, meta)
        -> for each Chunk:
             serialize(Chunk)  // [58B + name header][payload]
               -> cell codec render(buffer)

DECODE:
cell codec scan(image) -> buffer
  -> parse(buffer)  // validate and extract Chunk
      -> ok? reassembler[chunk.id].accept(Chunk)
            -> Complete ? finalize() -> decompress -> digest::verify -> file bytes
*/

namespace chunk
{

// --- Wire format constants ---
inline constexpr std::uint8_t  MAGIC[3]        = {'Q', 'R', 'B'};
inline constexpr std::uint8_t  WIRE_VER        = 1;
inline constexpr std::uint8_t  FLAG_COMPRESSED = 1 << 0;
inline constexpr std::size_t   MAX_FILENAME    = 64;
inline constexpr std::size_t   FIXED_HDR_SIZE  = 53;  // magic..name length
inline constexpr std::size_t   TAIL_HDR_SIZE   = 5;   // flags + payload length
inline constexpr std::size_t   MIN_WIRE_SIZE   = FIXED_HDR_SIZE + TAIL_HDR_SIZE;
inline constexpr std::uint32_t MAX_TOTAL       = UINT32_MAX;

/*
 Wire layout, all integers big-endian:
   0   3  magic "QRB"
   3   1  version
   4  32  content digest (SHA-256 of the uncompressed file)
  36   4  chunk index
  40   4  total chunk count
  44   8  original size
  52   1  filename length n (<= MAX_FILENAME)
  53   n  filename
  53+n 1  flags (bit 0: payload is a zlib stream slice)
  54+n 4  payload length
  58+n    payload
*/

// Grouping key: two chunks belong to the same transfer iff both fields match.
struct TransferId
{
    digest::Digest digest{};
    std::string    filename;

    bool operator==(const TransferId &o) const
    {
        return digest == o.digest && filename == o.filename;
    }
    bool operator!=(const TransferId &o) const { return !(*this == o); }
};

struct TransferIdHash
{
    std::size_t operator()(const TransferId &id) const
    {
        // the digest is already uniformly distributed
        std::size_t h = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
            h = (h << 8) | id.digest[i];
        return h ^ std::hash<std::string>{}(id.filename);
    }
};

struct Header
{
    std::uint8_t  ver{WIRE_VER};
    std::uint8_t  flags{0};
    TransferId    id;
    std::uint32_t index{0};
    std::uint32_t total{0};
    std::uint64_t original_size{0};
    std::uint32_t len{0};

    bool compressed() const { return (flags & FLAG_COMPRESSED) != 0; }
};

struct Chunk
{
    Header                    hdr;
    std::vector<std::uint8_t> payload;
};

// Which check rejected a buffer in parse().
enum class ParseFailure : std::uint8_t
{
    None = 0,
    TooShort,
    BadMagic,
    BadVersion,
    BadFilename,
    ZeroTotal,
    IndexOutOfRange,
    LengthMismatch
};

const char *failure_name(ParseFailure f);

// Truncate a filename to the wire bound without splitting a UTF-8 sequence.
std::string wire_filename(const std::string &name);

std::size_t header_size(const Header &h);

// TX
std::vector<std::uint8_t> serialize(const Chunk &c);
// RX
std::optional<Chunk> parse(const std::vector<std::uint8_t> &buf, ParseFailure *why = nullptr);

}  // namespace chunk
