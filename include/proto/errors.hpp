#pragma once
#include <cstdint>

namespace proto
{

// Failure categories shared by every stage of the encode/decode path.
enum class Error : std::uint8_t
{
    None = 0,
    MalformedChunk,     // buffer is not a valid wire chunk
    ForeignChunk,       // chunk belongs to another transfer
    ConflictingChunk,   // same index, different payload or metadata
    Incomplete,         // finalize() before every index arrived
    CorruptStream,      // compressed stream rejected by the inflater
    IntegrityMismatch,  // stream inflated fine, digest disagrees
    InvalidConfig,
    CapacityExceeded,  // wire buffer larger than the cell can carry
    InvalidState,
    NoChunks,
    Io
};

const char *error_name(Error e);

inline bool ok(Error e)
{
    return e == Error::None;
}

}  // namespace proto
