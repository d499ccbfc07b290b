#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "app/config.hpp"
#include "cell/icell_codec.hpp"
#include "proto/chunk.hpp"
#include "proto/errors.hpp"

namespace app
{

using Bytes = std::vector<std::uint8_t>;

// Missing indices listed per transfer; the rest is only counted.
inline constexpr std::size_t MISSING_REPORT_LIMIT = 1024;

// Outcome of one transfer in a decode. `data` is set only when status is None.
struct TransferResult
{
    chunk::TransferId          id;
    proto::Error               status{proto::Error::None};
    Bytes                      data;
    std::uint32_t              total{0};
    std::size_t                received{0};
    std::vector<std::uint32_t> missing;  // first MISSING_REPORT_LIMIT
    std::uint64_t              missing_count{0};
};

struct DecodeReport
{
    std::size_t                 buffers{0};
    std::size_t                 unreadable{0};  // cells whose scan failed
    std::size_t                 malformed{0};   // buffers rejected by chunk::parse
    std::vector<TransferResult> transfers;      // first-seen order
};

struct TransferAnalysis
{
    chunk::TransferId          id;
    std::uint32_t              total{0};
    std::uint64_t              original_size{0};
    bool                       compressed{false};
    std::vector<std::uint32_t> found;
    std::vector<std::uint32_t> missing;  // first MISSING_REPORT_LIMIT
    std::uint64_t              missing_count{0};
    std::size_t                duplicates{0};
    std::size_t                conflicts{0};
    bool                       complete{false};
};

struct AnalysisReport
{
    std::size_t                   buffers{0};
    std::size_t                   unreadable{0};
    std::size_t                   readable{0};
    std::size_t                   malformed{0};
    std::vector<TransferAnalysis> transfers;
};

struct Estimate
{
    std::uint64_t original_size{0};
    std::uint64_t compressed_size{0};
    std::size_t   chunks{0};
    std::size_t   wire_overhead{0};  // header bytes per wire buffer
    std::uint64_t wire_bytes{0};
    bool          exact{false};
};

class ConversionPipeline
{
  public:
    explicit ConversionPipeline(const Config &cfg) : cfg_(cfg) {}

    const Config &config() const { return cfg_; }

    // file -> ordered wire buffers
    proto::Error encode(const Bytes &file, const std::string &filename, std::vector<Bytes> &out) const;

    // wire buffers (any order, duplicates, noise) -> one result per transfer
    proto::Error decode(const std::vector<Bytes> &buffers, DecodeReport &report) const;

    // completeness per transfer, without inflating or verifying
    AnalysisReport analyze(const std::vector<Bytes> &buffers) const;

    // quick estimate from the size alone
    Estimate estimate(std::uint64_t original_size, const std::string &filename) const;
    // compresses for real, exact chunk count
    proto::Error estimate_exact(const Bytes &file, const std::string &filename, Estimate &out) const;

    // encode() followed by codec.render() per buffer
    proto::Error encode_cells(const Bytes              &file,
                              const std::string        &filename,
                              cell::ICellCodec         &codec,
                              std::vector<cell::Image> &images) const;
    // codec.scan() per image, unreadable cells counted and skipped, then decode()
    proto::Error decode_cells(const std::vector<cell::Image> &images,
                              cell::ICellCodec               &codec,
                              DecodeReport                   &report) const;
    AnalysisReport analyze_cells(const std::vector<cell::Image> &images,
                                 cell::ICellCodec               &codec) const;

  private:
    Config cfg_;
};

}  // namespace app
