#include "proto/errors.hpp"

namespace proto
{

const char *error_name(Error e)
{
    switch (e)
    {
        case Error::None:
            return "ok";
        case Error::MalformedChunk:
            return "malformed-chunk";
        case Error::ForeignChunk:
            return "foreign-chunk";
        case Error::ConflictingChunk:
            return "conflicting-chunk";
        case Error::Incomplete:
            return "incomplete";
        case Error::CorruptStream:
            return "corrupt-stream";
        case Error::IntegrityMismatch:
            return "integrity-mismatch";
        case Error::InvalidConfig:
            return "invalid-config";
        case Error::CapacityExceeded:
            return "capacity-exceeded";
        case Error::InvalidState:
            return "invalid-state";
        case Error::NoChunks:
            return "no-chunks";
        case Error::Io:
            return "io-error";
    }
    return "?";
}

}  // namespace proto
