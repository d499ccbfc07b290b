#include <unordered_map>
#include <utility>

#include "app/pipeline.hpp"
#include "codec/compressor.hpp"
#include "crypto/digest.hpp"
#include "proto/reassembler.hpp"
#include "proto/splitter.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

namespace
{

// Reassemblers keyed by transfer identity, kept in first-seen order.
struct Router
{
    struct Slot
    {
        chunk::Reassembler r;
        std::size_t        conflicts{0};
        proto::Error       first_conflict{proto::Error::None};
    };

    std::vector<Slot>                                                         slots;
    std::unordered_map<chunk::TransferId, std::size_t, chunk::TransferIdHash> index;

    Slot &slot_for(const chunk::TransferId &id)
    {
        auto it = index.find(id);
        if (it != index.end())
            return slots[it->second];
        index.emplace(id, slots.size());
        slots.push_back(Slot{chunk::Reassembler{id}});
        return slots.back();
    }

    void feed(const chunk::Chunk &c)
    {
        Slot              &s  = slot_for(c.hdr.id);
        const proto::Error rc = s.r.accept(c);
        if (rc == proto::Error::None)
            return;
        // foreign cannot happen here, routing is by the same key
        s.conflicts++;
        if (s.first_conflict == proto::Error::None)
            s.first_conflict = rc;
    }
};

// Parse every buffer; drop the ones that are not ours.
std::size_t route_all(const std::vector<Bytes> &buffers, Router &router)
{
    std::size_t malformed = 0;
    for (std::size_t i = 0; i < buffers.size(); ++i)
    {
        chunk::ParseFailure why = chunk::ParseFailure::None;
        auto                c   = chunk::parse(buffers[i], &why);
        if (!c)
        {
            LOG_WARN("buffer %zu dropped: %s", i, chunk::failure_name(why));
            malformed++;
            continue;
        }
        router.feed(*c);
    }
    return malformed;
}

proto::Error finish_transfer(Router::Slot &s, TransferResult &res)
{
    chunk::Reassembler &r = s.r;
    res.id                = r.id();
    res.total             = r.total();
    res.received          = r.received();

    if (s.first_conflict != proto::Error::None)
    {
        LOG_ERROR("'%s': %zu chunk(s) rejected (%s)", r.id().filename.c_str(), s.conflicts,
                  proto::error_name(s.first_conflict));
        res.missing       = r.missing(MISSING_REPORT_LIMIT);
        res.missing_count = r.missing_count();
        return s.first_conflict;
    }

    Bytes              stream;
    const proto::Error fin = r.finalize(stream);
    if (fin != proto::Error::None)
    {
        res.missing       = r.missing(MISSING_REPORT_LIMIT);
        res.missing_count = r.missing_count();
        return fin;
    }

    Bytes data;
    if (r.compressed())
    {
        const proto::Error rc = compressor::decompress(stream, r.original_size(), data);
        if (rc != proto::Error::None)
            return rc;
    }
    else
    {
        if (stream.size() != r.original_size())
        {
            LOG_ERROR("'%s': stream is %zu bytes, header says %llu", r.id().filename.c_str(),
                      stream.size(), static_cast<unsigned long long>(r.original_size()));
            return proto::Error::CorruptStream;
        }
        data = std::move(stream);
    }

    if (!digest::verify(data, r.id().digest))
    {
        LOG_ERROR("'%s': digest mismatch (expect %s, got %s)", r.id().filename.c_str(),
                  digest::to_hex(r.id().digest).c_str(), digest::to_hex(digest::compute(data)).c_str());
        return proto::Error::IntegrityMismatch;
    }
    res.data = std::move(data);
    return proto::Error::None;
}

}  // namespace

proto::Error ConversionPipeline::encode(const Bytes        &file,
                                        const std::string  &filename,
                                        std::vector<Bytes> &out) const
{
    out.clear();
    if (!validate(cfg_))
        return proto::Error::InvalidConfig;

    chunk::TransferMeta meta;
    meta.id.digest     = digest::compute(file);
    meta.id.filename   = chunk::wire_filename(filename);
    meta.original_size = file.size();

    compressor::Compressed comp;
    if (!compressor::compress(file, cfg_.effort, comp))
        return proto::Error::InvalidConfig;
    meta.compressed = comp.compressed;

    auto chunks = chunk::split(comp.data, cfg_.chunk_size, meta);
    if (chunks.empty())
        return proto::Error::InvalidConfig;

    out.reserve(chunks.size());
    for (const auto &c : chunks)
    {
        auto buf = chunk::serialize(c);
        if (buf.empty())
        {
            out.clear();
            return proto::Error::MalformedChunk;
        }
        if (cfg_.cell_capacity != 0 && buf.size() > cfg_.cell_capacity)
        {
            LOG_ERROR("chunk %u is %zu bytes on the wire, cell capacity is %zu", c.hdr.index,
                      buf.size(), cfg_.cell_capacity);
            out.clear();
            return proto::Error::CapacityExceeded;
        }
        out.push_back(std::move(buf));
    }

    LOG_INFO("encoded '%s': %zu -> %zu bytes, %zu chunk(s) [%s]", meta.id.filename.c_str(),
             file.size(), comp.data.size(), out.size(), summary(cfg_).c_str());
    return proto::Error::None;
}

proto::Error ConversionPipeline::decode(const std::vector<Bytes> &buffers,
                                        DecodeReport             &report) const
{
    report.buffers += buffers.size();

    Router router;
    report.malformed += route_all(buffers, router);
    if (router.slots.empty())
    {
        LOG_ERROR("decode: no usable chunks in %zu buffer(s)", buffers.size());
        return proto::Error::NoChunks;
    }

    proto::Error first = proto::Error::None;
    for (auto &s : router.slots)
    {
        TransferResult res;
        res.status = finish_transfer(s, res);
        if (res.status == proto::Error::None)
        {
            LOG_INFO("decoded '%s' (%zu bytes, %u chunk(s))", res.id.filename.c_str(),
                     res.data.size(), res.total);
        }
        else
        {
            LOG_ERROR("transfer '%s' failed: %s", res.id.filename.c_str(),
                      proto::error_name(res.status));
            if (first == proto::Error::None)
                first = res.status;
        }
        report.transfers.push_back(std::move(res));
    }
    return first;
}

AnalysisReport ConversionPipeline::analyze(const std::vector<Bytes> &buffers) const
{
    AnalysisReport rep;
    rep.buffers = buffers.size();

    Router router;
    rep.malformed = route_all(buffers, router);
    rep.readable  = buffers.size() - rep.malformed;

    for (const auto &s : router.slots)
    {
        const chunk::Reassembler &r = s.r;
        TransferAnalysis          a;
        a.id            = r.id();
        a.total         = r.total();
        a.original_size = r.original_size();
        a.compressed    = r.compressed();
        a.missing       = r.missing(MISSING_REPORT_LIMIT);
        a.missing_count = r.missing_count();
        a.found         = r.received_indices();
        a.duplicates    = r.duplicates();
        a.conflicts     = s.conflicts;
        a.complete      = r.complete() && s.conflicts == 0;
        rep.transfers.push_back(std::move(a));
    }
    return rep;
}

Estimate ConversionPipeline::estimate(std::uint64_t original_size, const std::string &filename) const
{
    Estimate e;
    e.original_size   = original_size;
    e.compressed_size = cfg_.effort == 0
                            ? original_size
                            : static_cast<std::uint64_t>(static_cast<double>(original_size) *
                                                         constants::ESTIMATE_RATIO);
    e.chunks          = chunk::count_chunks(static_cast<std::size_t>(e.compressed_size), cfg_.chunk_size);
    e.wire_overhead   = chunk::MIN_WIRE_SIZE + chunk::wire_filename(filename).size();
    e.wire_bytes      = e.compressed_size + static_cast<std::uint64_t>(e.chunks) * e.wire_overhead;
    e.exact           = false;
    return e;
}

proto::Error ConversionPipeline::estimate_exact(const Bytes       &file,
                                                const std::string &filename,
                                                Estimate          &out) const
{
    if (!validate(cfg_))
        return proto::Error::InvalidConfig;
    compressor::Compressed comp;
    if (!compressor::compress(file, cfg_.effort, comp))
        return proto::Error::InvalidConfig;

    out.original_size   = file.size();
    out.compressed_size = comp.data.size();
    out.chunks          = chunk::count_chunks(comp.data.size(), cfg_.chunk_size);
    out.wire_overhead   = chunk::MIN_WIRE_SIZE + chunk::wire_filename(filename).size();
    out.wire_bytes      = out.compressed_size + static_cast<std::uint64_t>(out.chunks) * out.wire_overhead;
    out.exact           = true;
    return proto::Error::None;
}

proto::Error ConversionPipeline::encode_cells(const Bytes              &file,
                                              const std::string        &filename,
                                              cell::ICellCodec         &codec,
                                              std::vector<cell::Image> &images) const
{
    images.clear();
    Config cfg = cfg_;
    if (codec.max_buffer() != 0 && (cfg.cell_capacity == 0 || codec.max_buffer() < cfg.cell_capacity))
        cfg.cell_capacity = codec.max_buffer();

    std::vector<Bytes> buffers;
    const proto::Error rc = ConversionPipeline(cfg).encode(file, filename, buffers);
    if (rc != proto::Error::None)
        return rc;

    cell::Hints hints;
    hints.qr_version = cfg.qr_version;
    hints.ecc        = cfg.ecc;

    images.reserve(buffers.size());
    for (std::size_t i = 0; i < buffers.size(); ++i)
    {
        cell::Image img;
        if (!codec.render(buffers[i], hints, img))
        {
            LOG_ERROR("cell codec '%s' failed to render chunk %zu", codec.name().c_str(), i);
            images.clear();
            return proto::Error::CapacityExceeded;
        }
        images.push_back(std::move(img));
    }
    return proto::Error::None;
}

static std::vector<Bytes> scan_all(const std::vector<cell::Image> &images,
                                   cell::ICellCodec               &codec,
                                   std::size_t                    &unreadable)
{
    std::vector<Bytes> buffers;
    buffers.reserve(images.size());
    for (std::size_t i = 0; i < images.size(); ++i)
    {
        Bytes buf;
        if (!codec.scan(images[i], buf))
        {
            LOG_WARN("cell %zu unreadable, skipped", i);
            unreadable++;
            continue;
        }
        buffers.push_back(std::move(buf));
    }
    return buffers;
}

proto::Error ConversionPipeline::decode_cells(const std::vector<cell::Image> &images,
                                              cell::ICellCodec               &codec,
                                              DecodeReport                   &report) const
{
    std::size_t unreadable = 0;
    auto        buffers    = scan_all(images, codec, unreadable);
    report.unreadable += unreadable;
    return decode(buffers, report);
}

AnalysisReport ConversionPipeline::analyze_cells(const std::vector<cell::Image> &images,
                                                 cell::ICellCodec               &codec) const
{
    std::size_t unreadable = 0;
    auto        buffers    = scan_all(images, codec, unreadable);
    AnalysisReport rep     = analyze(buffers);
    rep.buffers            = images.size();
    rep.unreadable         = unreadable;
    return rep;
}

}  // namespace app
