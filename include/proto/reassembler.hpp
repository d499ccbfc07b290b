#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#include "proto/chunk.hpp"
#include "proto/errors.hpp"

namespace chunk
{

// Collects the chunks of ONE transfer in any order. Not thread-safe: callers
// feeding the same instance from several threads must serialize accept().
class Reassembler
{
  public:
    enum class State
    {
        Collecting,
        Complete,
        Finalized
    };

    // Identity taken from the first accepted chunk.
    Reassembler() = default;
    // Identity pinned up front; chunks of any other transfer are foreign.
    explicit Reassembler(const TransferId &id) : id_(id), have_id_(true) {}

    // None for a stored chunk or an identical duplicate.
    // ForeignChunk / ConflictingChunk / MalformedChunk / InvalidState leave state untouched.
    proto::Error accept(const Chunk &c);

    // Concatenate payloads in index order. Only valid in State::Complete.
    proto::Error finalize(std::vector<std::uint8_t> &out);

    // Sorted indices not yet received, at most `limit` of them; empty before
    // the first chunk. `total` comes off the wire, so callers reporting on
    // untrusted input pass a limit.
    std::vector<std::uint32_t> missing(std::size_t limit = SIZE_MAX) const;
    std::uint64_t              missing_count() const;
    // Sorted indices received so far.
    std::vector<std::uint32_t> received_indices() const;

    State             state() const { return state_; }
    bool              complete() const { return state_ == State::Complete; }
    bool              has_meta() const { return have_meta_; }
    const TransferId &id() const { return id_; }
    std::uint32_t     total() const { return total_; }
    std::size_t       received() const { return parts_.size(); }
    std::size_t       bytes() const { return bytes_; }
    std::size_t       duplicates() const { return duplicates_; }
    std::uint64_t     original_size() const { return original_size_; }
    bool              compressed() const { return (flags_ & FLAG_COMPRESSED) != 0; }

  private:
    TransferId                                         id_;
    bool                                               have_id_{false};
    bool                                               have_meta_{false};
    std::uint32_t                                      total_{0};
    std::uint64_t                                      original_size_{0};
    std::uint8_t                                       flags_{0};
    std::map<std::uint32_t, std::vector<std::uint8_t>> parts_;
    std::size_t                                        bytes_{0};
    std::size_t                                        duplicates_{0};
    State                                              state_{State::Collecting};
};

const char *state_name(Reassembler::State s);

}  // namespace chunk
