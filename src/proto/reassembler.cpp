#include <string>

#include "proto/reassembler.hpp"
#include "util/log.hpp"

namespace chunk
{

const char *state_name(Reassembler::State s)
{
    switch (s)
    {
        case Reassembler::State::Collecting:
            return "collecting";
        case Reassembler::State::Complete:
            return "complete";
        case Reassembler::State::Finalized:
            return "finalized";
    }
    return "?";
}

proto::Error Reassembler::accept(const Chunk &c)
{
    // make sure this is a valid chunk
    if (c.hdr.total == 0 || c.hdr.index >= c.hdr.total || c.hdr.len != c.payload.size())
    {
        LOG_ERROR("accept: invalid chunk (index=%u, total=%u)", c.hdr.index, c.hdr.total);
        return proto::Error::MalformedChunk;
    }
    if (state_ == State::Finalized)
    {
        LOG_WARN("accept: transfer '%s' already finalized", id_.filename.c_str());
        return proto::Error::InvalidState;
    }
    if (have_id_ && c.hdr.id != id_)
    {
        LOG_DEBUG("accept: foreign chunk '%s' for transfer '%s'", c.hdr.id.filename.c_str(),
                  id_.filename.c_str());
        return proto::Error::ForeignChunk;
    }

    const std::uint8_t flags = c.hdr.flags & FLAG_COMPRESSED;
    if (have_meta_ &&
        (c.hdr.total != total_ || c.hdr.original_size != original_size_ || flags != flags_))
    {
        LOG_ERROR("accept: chunk %u of '%s' disagrees on transfer metadata (total %u vs %u)",
                  c.hdr.index, id_.filename.c_str(), c.hdr.total, total_);
        return proto::Error::ConflictingChunk;
    }

    auto it = parts_.find(c.hdr.index);
    if (it != parts_.end())
    {
        if (it->second != c.payload)
        {
            LOG_ERROR("accept: conflicting payload for chunk %u of '%s'", c.hdr.index,
                      id_.filename.c_str());
            return proto::Error::ConflictingChunk;
        }
        // nop
        duplicates_++;
        LOG_DEBUG("accept: duplicate chunk %u of '%s'", c.hdr.index, id_.filename.c_str());
        return proto::Error::None;
    }

    if (!have_id_)
    {
        id_      = c.hdr.id;
        have_id_ = true;
    }
    if (!have_meta_)
    {
        total_         = c.hdr.total;
        original_size_ = c.hdr.original_size;
        flags_         = flags;
        have_meta_     = true;
    }

    parts_.emplace(c.hdr.index, c.payload);
    bytes_ += c.payload.size();

    if (parts_.size() == total_)
    {
        state_ = State::Complete;
        LOG_DEBUG("accept: transfer '%s' complete (%u chunks, %zu bytes)", id_.filename.c_str(),
                  total_, bytes_);
    }
    return proto::Error::None;
}

proto::Error Reassembler::finalize(std::vector<std::uint8_t> &out)
{
    if (state_ == State::Finalized)
    {
        LOG_ERROR("finalize: transfer '%s' already finalized", id_.filename.c_str());
        return proto::Error::InvalidState;
    }
    if (state_ != State::Complete)
    {
        const auto  gaps = missing(16);
        std::string list;
        for (std::size_t i = 0; i < gaps.size(); ++i)
        {
            if (i)
                list += ',';
            list += std::to_string(gaps[i]);
        }
        if (missing_count() > gaps.size())
            list += ",...";
        LOG_ERROR("finalize: transfer '%s' incomplete (%zu/%u), missing [%s]",
                  id_.filename.c_str(), parts_.size(), total_, list.c_str());
        return proto::Error::Incomplete;
    }

    // reassemble, map iteration is in index order
    out.clear();
    out.reserve(bytes_);
    for (auto &kv : parts_)
        out.insert(out.end(), kv.second.begin(), kv.second.end());

    // clear state
    parts_.clear();
    state_ = State::Finalized;
    return proto::Error::None;
}

std::vector<std::uint32_t> Reassembler::missing(std::size_t limit) const
{
    std::vector<std::uint32_t> out;
    if (!have_meta_ || state_ != State::Collecting)
        return out;
    auto it = parts_.begin();
    for (std::uint32_t i = 0; i < total_ && out.size() < limit; ++i)
    {
        if (it != parts_.end() && it->first == i)
        {
            ++it;
            continue;
        }
        out.push_back(i);
    }
    return out;
}

std::uint64_t Reassembler::missing_count() const
{
    if (!have_meta_ || state_ != State::Collecting)
        return 0;
    return static_cast<std::uint64_t>(total_) - parts_.size();
}

std::vector<std::uint32_t> Reassembler::received_indices() const
{
    std::vector<std::uint32_t> out;
    out.reserve(parts_.size());
    for (const auto &kv : parts_)
        out.push_back(kv.first);
    return out;
}

}  // namespace chunk
