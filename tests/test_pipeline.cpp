// tests/test_pipeline.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "app/pipeline.hpp"
#include "cell/file_cell_codec.hpp"
#include "proto/chunk.hpp"

using app::Bytes;
using app::Config;
using app::ConversionPipeline;

static Bytes text_bytes(std::size_t n)
{
    static const std::string words = "lorem ipsum dolor sit amet consectetur adipiscing elit ";
    Bytes                    v(n);
    for (std::size_t i = 0; i < n; ++i)
        v[i] = static_cast<std::uint8_t>(words[(i * 3 + i / 11) % words.size()]);
    return v;
}

static Bytes random_bytes(std::size_t n, unsigned seed)
{
    std::mt19937 rng(seed);
    Bytes        v(n);
    for (auto &b : v)
        b = static_cast<std::uint8_t>(rng() & 0xFF);
    return v;
}

static Config cfg_with(std::size_t chunk, int effort)
{
    Config c;
    c.chunk_size = chunk;
    c.effort     = effort;
    return c;
}

// payload offset of a serialized buffer
static std::size_t payload_offset(const Bytes &buf)
{
    return chunk::MIN_WIRE_SIZE + buf[52];
}

TEST(Pipeline, RoundtripAcrossConfigs)
{
    const std::vector<Bytes> inputs = {Bytes{}, Bytes{0x42}, text_bytes(777), text_bytes(20000),
                                       random_bytes(3000, 7)};
    const std::vector<Config> cfgs  = {cfg_with(1, 0),       cfg_with(64, 1),
                                      cfg_with(1024, 9),    app::fast_config(),
                                      app::compact_config(), app::robust_config()};

    for (const auto &cfg : cfgs)
    {
        ConversionPipeline p(cfg);
        for (const auto &in : inputs)
        {
            if (cfg.chunk_size == 1 && in.size() > 1000)
                continue;  // keep the one-byte-chunk case small
            std::vector<Bytes> wire;
            ASSERT_EQ(p.encode(in, "input.dat", wire), proto::Error::None);
            ASSERT_FALSE(wire.empty());

            app::DecodeReport rep;
            ASSERT_EQ(p.decode(wire, rep), proto::Error::None) << app::summary(cfg);
            ASSERT_EQ(rep.transfers.size(), 1u);
            EXPECT_EQ(rep.transfers[0].status, proto::Error::None);
            EXPECT_EQ(rep.transfers[0].data, in);
            EXPECT_EQ(rep.transfers[0].id.filename, "input.dat");
        }
    }
}

TEST(Pipeline, EmptyFileIsOneChunk)
{
    ConversionPipeline p(cfg_with(1024, 9));
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode({}, "empty", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 1u);

    auto c = chunk::parse(wire[0]);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->hdr.total, 1u);
    EXPECT_EQ(c->hdr.original_size, 0u);

    app::DecodeReport rep;
    ASSERT_EQ(p.decode(wire, rep), proto::Error::None);
    EXPECT_TRUE(rep.transfers[0].data.empty());

    // passthrough: a truly empty payload
    ConversionPipeline raw(cfg_with(1024, 0));
    ASSERT_EQ(raw.encode({}, "empty", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 1u);
    EXPECT_EQ(chunk::parse(wire[0])->hdr.len, 0u);
    app::DecodeReport rep2;
    ASSERT_EQ(raw.decode(wire, rep2), proto::Error::None);
    EXPECT_TRUE(rep2.transfers[0].data.empty());
}

TEST(Pipeline, FiveThousandBytesUncompressed)
{
    ConversionPipeline p(cfg_with(1024, 0));
    auto               in = random_bytes(5000, 3);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "five", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 5u);

    const std::vector<std::uint32_t> sizes = {1024, 1024, 1024, 1024, 904};
    for (std::size_t i = 0; i < wire.size(); ++i)
    {
        auto c = chunk::parse(wire[i]);
        ASSERT_TRUE(c.has_value());
        EXPECT_EQ(c->hdr.len, sizes[i]);
        EXPECT_FALSE(c->hdr.compressed());
    }
}

TEST(Pipeline, ShuffledDuplicatedAndNoisy)
{
    ConversionPipeline p(cfg_with(100, 6));
    auto               in = text_bytes(8000);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "noisy.txt", wire), proto::Error::None);

    std::vector<Bytes> scans = wire;
    scans.push_back(wire[0]);  // rescans
    scans.push_back(wire[wire.size() - 1]);
    scans.push_back(Bytes{'h', 't', 't', 'p'});  // unrelated QR code
    scans.push_back(Bytes(80, 0));
    std::mt19937 rng(99);
    std::shuffle(scans.begin(), scans.end(), rng);

    app::DecodeReport rep;
    ASSERT_EQ(p.decode(scans, rep), proto::Error::None);
    EXPECT_EQ(rep.malformed, 2u);
    ASSERT_EQ(rep.transfers.size(), 1u);
    EXPECT_EQ(rep.transfers[0].data, in);
}

TEST(Pipeline, MissingChunkIsIncomplete)
{
    ConversionPipeline p(cfg_with(64, 0));
    auto               in = random_bytes(640, 5);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "gappy", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 10u);

    wire.erase(wire.begin() + 7);
    wire.erase(wire.begin() + 2);

    app::DecodeReport rep;
    EXPECT_EQ(p.decode(wire, rep), proto::Error::Incomplete);
    ASSERT_EQ(rep.transfers.size(), 1u);
    EXPECT_EQ(rep.transfers[0].status, proto::Error::Incomplete);
    EXPECT_TRUE(rep.transfers[0].data.empty());
    const std::vector<std::uint32_t> want = {2, 7};
    EXPECT_EQ(rep.transfers[0].missing, want);
}

TEST(Pipeline, TamperUncompressedIsIntegrityMismatch)
{
    ConversionPipeline p(cfg_with(256, 0));
    auto               in = random_bytes(1000, 11);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "tamper", wire), proto::Error::None);

    wire[2][payload_offset(wire[2]) + 10] ^= 0x01;

    app::DecodeReport rep;
    EXPECT_EQ(p.decode(wire, rep), proto::Error::IntegrityMismatch);
    EXPECT_EQ(rep.transfers[0].status, proto::Error::IntegrityMismatch);
    EXPECT_TRUE(rep.transfers[0].data.empty());
}

TEST(Pipeline, TamperCompressedNeverSilent)
{
    ConversionPipeline p(cfg_with(64, 9));
    auto               in = text_bytes(6000);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "tamper.txt", wire), proto::Error::None);
    ASSERT_GT(wire.size(), 1u);

    for (std::size_t which = 0; which < wire.size(); ++which)
    {
        auto        bad = wire;
        std::size_t off = payload_offset(bad[which]);
        std::size_t len = bad[which].size() - off;
        if (len == 0)
            continue;
        bad[which][off + len / 2] ^= 0x20;

        app::DecodeReport  rep;
        const proto::Error rc = p.decode(bad, rep);
        EXPECT_TRUE(rc == proto::Error::CorruptStream || rc == proto::Error::IntegrityMismatch)
            << "chunk " << which << ": " << proto::error_name(rc);
        EXPECT_TRUE(rep.transfers[0].data.empty());
    }
}

TEST(Pipeline, ConflictingRescanSurfaced)
{
    ConversionPipeline p(cfg_with(100, 0));
    auto               in = random_bytes(500, 21);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "conflict", wire), proto::Error::None);

    Bytes wrong = wire[3];
    wrong[payload_offset(wrong)] ^= 0xFF;
    wire.push_back(wrong);

    app::DecodeReport rep;
    EXPECT_EQ(p.decode(wire, rep), proto::Error::ConflictingChunk);
    EXPECT_EQ(rep.transfers[0].status, proto::Error::ConflictingChunk);
}

TEST(Pipeline, MultipleTransfersFailIndependently)
{
    ConversionPipeline p(cfg_with(50, 6));
    auto               a = text_bytes(1200);
    auto               b = random_bytes(400, 2);
    std::vector<Bytes> wa, wb;
    ASSERT_EQ(p.encode(a, "a.txt", wa), proto::Error::None);
    ASSERT_EQ(p.encode(b, "b.bin", wb), proto::Error::None);
    ASSERT_GT(wb.size(), 2u);
    wb.pop_back();  // b loses its last chunk

    std::vector<Bytes> mixed;
    for (std::size_t i = 0; i < std::max(wa.size(), wb.size()); ++i)
    {
        if (i < wb.size())
            mixed.push_back(wb[i]);
        if (i < wa.size())
            mixed.push_back(wa[i]);
    }

    app::DecodeReport rep;
    EXPECT_EQ(p.decode(mixed, rep), proto::Error::Incomplete);
    ASSERT_EQ(rep.transfers.size(), 2u);

    // first-seen order: b came first
    EXPECT_EQ(rep.transfers[0].id.filename, "b.bin");
    EXPECT_EQ(rep.transfers[0].status, proto::Error::Incomplete);
    EXPECT_EQ(rep.transfers[1].id.filename, "a.txt");
    EXPECT_EQ(rep.transfers[1].status, proto::Error::None);
    EXPECT_EQ(rep.transfers[1].data, a);
}

TEST(Pipeline, NothingParsable)
{
    ConversionPipeline p(Config{});
    app::DecodeReport  rep;
    EXPECT_EQ(p.decode({Bytes{1, 2, 3}}, rep), proto::Error::NoChunks);
    EXPECT_EQ(rep.malformed, 1u);
    EXPECT_TRUE(rep.transfers.empty());
    EXPECT_EQ(p.decode({}, rep), proto::Error::NoChunks);
}

TEST(Pipeline, AnalyzeReportsGaps)
{
    ConversionPipeline p(cfg_with(32, 0));
    auto               in = random_bytes(320, 8);
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(in, "scan-me", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 10u);

    std::vector<Bytes> partial = {wire[9], wire[0], wire[0], wire[5], Bytes{9, 9, 9}};
    auto               rep     = p.analyze(partial);
    EXPECT_EQ(rep.buffers, 5u);
    EXPECT_EQ(rep.readable, 4u);
    EXPECT_EQ(rep.malformed, 1u);
    ASSERT_EQ(rep.transfers.size(), 1u);

    const auto &t = rep.transfers[0];
    EXPECT_EQ(t.id.filename, "scan-me");
    EXPECT_EQ(t.total, 10u);
    EXPECT_EQ(t.original_size, 320u);
    EXPECT_FALSE(t.compressed);
    EXPECT_FALSE(t.complete);
    EXPECT_EQ(t.duplicates, 1u);
    EXPECT_EQ(t.found, (std::vector<std::uint32_t>{0, 5, 9}));
    EXPECT_EQ(t.missing, (std::vector<std::uint32_t>{1, 2, 3, 4, 6, 7, 8}));

    auto full = p.analyze(wire);
    ASSERT_EQ(full.transfers.size(), 1u);
    EXPECT_TRUE(full.transfers[0].complete);
    EXPECT_TRUE(full.transfers[0].missing.empty());
    EXPECT_EQ(full.transfers[0].found.size(), 10u);
}

TEST(Pipeline, InvalidConfigRejected)
{
    std::vector<Bytes> wire;
    EXPECT_EQ(ConversionPipeline(cfg_with(0, 9)).encode(text_bytes(10), "x", wire),
              proto::Error::InvalidConfig);
    EXPECT_EQ(ConversionPipeline(cfg_with(100, 12)).encode(text_bytes(10), "x", wire),
              proto::Error::InvalidConfig);
    EXPECT_TRUE(wire.empty());
}

TEST(Pipeline, CapacityExceeded)
{
    Config cfg        = cfg_with(500, 0);
    cfg.cell_capacity = 300;
    std::vector<Bytes> wire;
    EXPECT_EQ(ConversionPipeline(cfg).encode(random_bytes(1000, 1), "big", wire),
              proto::Error::CapacityExceeded);
    EXPECT_TRUE(wire.empty());

    cfg.cell_capacity = 500 + chunk::MIN_WIRE_SIZE + 3;
    EXPECT_EQ(ConversionPipeline(cfg).encode(random_bytes(1000, 1), "big", wire),
              proto::Error::None);
    EXPECT_EQ(wire.size(), 2u);
}

TEST(Pipeline, Estimate)
{
    ConversionPipeline raw(cfg_with(1024, 0));
    auto               e = raw.estimate(5000, "five");
    EXPECT_EQ(e.compressed_size, 5000u);
    EXPECT_EQ(e.chunks, 5u);
    EXPECT_EQ(e.wire_overhead, chunk::MIN_WIRE_SIZE + 4);
    EXPECT_EQ(e.wire_bytes, 5000u + 5u * e.wire_overhead);
    EXPECT_FALSE(e.exact);

    ConversionPipeline packed(cfg_with(1024, 9));
    auto               g = packed.estimate(10000, "ten");
    EXPECT_NEAR(static_cast<double>(g.compressed_size), 7000.0, 1.0);
    EXPECT_EQ(g.chunks, 7u);

    auto               in = text_bytes(10000);
    app::Estimate      x;
    std::vector<Bytes> wire;
    ASSERT_EQ(packed.estimate_exact(in, "ten", x), proto::Error::None);
    ASSERT_EQ(packed.encode(in, "ten", wire), proto::Error::None);
    EXPECT_TRUE(x.exact);
    EXPECT_EQ(x.chunks, wire.size());
}

TEST(Pipeline, CellsRoundtripWithUnreadableCell)
{
    ConversionPipeline       p(cfg_with(200, 9));
    cell::FileCellCodec      codec;
    auto                     in = random_bytes(3000, 12);
    std::vector<cell::Image> images;
    ASSERT_EQ(p.encode_cells(in, "cells.bin", codec, images), proto::Error::None);
    ASSERT_GT(images.size(), 1u);

    app::DecodeReport rep;
    ASSERT_EQ(p.decode_cells(images, codec, rep), proto::Error::None);
    EXPECT_EQ(rep.transfers[0].data, in);

    // a smudged cell fails its own CRC, the transfer is then incomplete
    images[0][cell::FileCellCodec::CELL_HDR_SIZE] ^= 0x01;
    app::DecodeReport rep2;
    EXPECT_EQ(p.decode_cells(images, codec, rep2), proto::Error::Incomplete);
    EXPECT_EQ(rep2.unreadable, 1u);
    EXPECT_EQ(rep2.transfers[0].missing, (std::vector<std::uint32_t>{0}));

    auto an = p.analyze_cells(images, codec);
    EXPECT_EQ(an.buffers, images.size());
    EXPECT_EQ(an.unreadable, 1u);
}

TEST(Pipeline, CodecCapacityCapsEncode)
{
    ConversionPipeline       p(cfg_with(1000, 0));
    cell::FileCellCodec      small(100);
    std::vector<cell::Image> images;
    EXPECT_EQ(p.encode_cells(random_bytes(500, 4), "x", small, images),
              proto::Error::CapacityExceeded);
    EXPECT_TRUE(images.empty());
}

TEST(Pipeline, HugeOriginalSizeFailsAloneAndCheaply)
{
    for (int effort : {0, 9})
    {
        ConversionPipeline p(cfg_with(1024, effort));
        auto               a = random_bytes(100, 31);
        auto               b = random_bytes(100, 32);
        std::vector<Bytes> wa, wb;
        ASSERT_EQ(p.encode(a, "a.bin", wa), proto::Error::None);
        ASSERT_EQ(p.encode(b, "b.bin", wb), proto::Error::None);
        ASSERT_EQ(wa.size(), 1u);

        wa[0][45] ^= 0x10;  // high bits of the original size

        std::vector<Bytes> both = {wa[0], wb[0]};
        app::DecodeReport  rep;
        EXPECT_EQ(p.decode(both, rep), proto::Error::CorruptStream) << "effort " << effort;
        ASSERT_EQ(rep.transfers.size(), 2u);
        EXPECT_EQ(rep.transfers[0].status, proto::Error::CorruptStream);
        EXPECT_TRUE(rep.transfers[0].data.empty());
        EXPECT_EQ(rep.transfers[1].status, proto::Error::None);
        EXPECT_EQ(rep.transfers[1].data, b);
    }
}

TEST(Pipeline, HugeTotalOnFirstSeenChunk)
{
    ConversionPipeline p(cfg_with(50, 0));
    auto               a = random_bytes(200, 41);
    auto               b = random_bytes(120, 42);
    std::vector<Bytes> wa, wb;
    ASSERT_EQ(p.encode(a, "a.bin", wa), proto::Error::None);
    ASSERT_EQ(p.encode(b, "b.bin", wb), proto::Error::None);
    ASSERT_EQ(wa.size(), 4u);

    wa[0][40] = 0x7f;  // total becomes 0x7f000004 and is seen first

    std::vector<Bytes> mixed = wa;
    mixed.insert(mixed.end(), wb.begin(), wb.end());

    app::DecodeReport rep;
    EXPECT_EQ(p.decode(mixed, rep), proto::Error::ConflictingChunk);
    ASSERT_EQ(rep.transfers.size(), 2u);

    const auto &bad = rep.transfers[0];
    EXPECT_EQ(bad.status, proto::Error::ConflictingChunk);
    EXPECT_EQ(bad.total, 0x7f000004u);
    EXPECT_EQ(bad.received, 1u);
    EXPECT_EQ(bad.missing.size(), app::MISSING_REPORT_LIMIT);
    EXPECT_EQ(bad.missing.front(), 1u);
    EXPECT_EQ(bad.missing_count, 0x7f000004ull - 1);

    EXPECT_EQ(rep.transfers[1].status, proto::Error::None);
    EXPECT_EQ(rep.transfers[1].data, b);
}

TEST(Pipeline, AnalyzeHugeTotalIsBounded)
{
    ConversionPipeline p(cfg_with(1024, 9));
    std::vector<Bytes> wire;
    ASSERT_EQ(p.encode(random_bytes(100, 51), "t.bin", wire), proto::Error::None);
    ASSERT_EQ(wire.size(), 1u);
    wire[0][40] = 0x7f;

    auto rep = p.analyze(wire);
    ASSERT_EQ(rep.transfers.size(), 1u);
    const auto &t = rep.transfers[0];
    EXPECT_EQ(t.total, 0x7f000001u);
    EXPECT_FALSE(t.complete);
    EXPECT_EQ(t.found, (std::vector<std::uint32_t>{0}));
    EXPECT_EQ(t.missing.size(), app::MISSING_REPORT_LIMIT);
    EXPECT_EQ(t.missing_count, 0x7f000000ull);
}
