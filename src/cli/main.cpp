#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "app/config.hpp"
#include "app/pipeline.hpp"
#include "cell/file_cell_codec.hpp"
#include "crypto/digest.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/file_ops.hpp"
#include "util/log.hpp"

namespace
{

struct Options
{
    app::Config              cfg;
    std::string              out_dir;
    bool                     exact{false};
    std::vector<std::string> positional;
};

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr,
                 "Usage:\n"
                 "  qrare [--log-level debug|info|warn|error] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  encode <file> [-o DIR] [options]\n"
                 "  decode <cell|dir...> [-o DIR]\n"
                 "  analyze <cell|dir...>\n"
                 "  estimate <file> [--exact] [options]\n"
                 "  version\n"
                 "\n"
                 "Options:\n"
                 "  --preset fast|compact|robust\n"
                 "  --chunk-size N      bytes of compressed stream per cell\n"
                 "  --effort N          compression effort 0..9 (0 = off)\n"
                 "  --qr-version N      density hint 1..40\n"
                 "  --ecc L|M|Q|H       error-correction hint\n"
                 "  --capacity N        max wire bytes per cell (0 = unchecked)\n");
}

static bool parse_num(const std::string &s, unsigned long long &out)
{
    if (s.empty() || s[0] == '-')
        return false;
    errno     = 0;
    char *end = nullptr;
    out       = std::strtoull(s.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0';
}

static int exit_for(proto::Error e)
{
    switch (e)
    {
        case proto::Error::None:
            return exitc::ok;
        case proto::Error::InvalidConfig:
        case proto::Error::CapacityExceeded:
            return exitc::bad_args;
        case proto::Error::Io:
            return exitc::io_error;
        case proto::Error::NoChunks:
        case proto::Error::MalformedChunk:
            return exitc::no_chunks;
        case proto::Error::Incomplete:
            return exitc::incomplete;
        case proto::Error::IntegrityMismatch:
            return exitc::integrity;
        case proto::Error::ForeignChunk:
        case proto::Error::ConflictingChunk:
        case proto::Error::CorruptStream:
        case proto::Error::InvalidState:
            return exitc::corrupt;
    }
    return exitc::corrupt;
}

// Options after the command word. Flags override preset and environment.
static bool parse_options(const std::vector<std::string> &args, Options &o)
{
    std::string preset;
    std::size_t chunk_override = 0;
    std::vector<std::pair<std::string, std::string>> flags;

    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string &a = args[i];
        if (a == "--exact")
        {
            o.exact = true;
            continue;
        }
        if (a == "-o" || a == "--output" || a == "--preset" || a == "--chunk-size" ||
            a == "--effort" || a == "--qr-version" || a == "--ecc" || a == "--capacity")
        {
            if (i + 1 >= args.size())
            {
                std::fprintf(stderr, "error: %s needs a value\n", a.c_str());
                return false;
            }
            const std::string &v = args[++i];
            if (a == "-o" || a == "--output")
                o.out_dir = fileops::expand_user(v);
            else if (a == "--preset")
                preset = v;
            else
                flags.emplace_back(a, v);
            continue;
        }
        if (a.size() > 1 && a[0] == '-')
        {
            std::fprintf(stderr, "error: unknown option %s\n", a.c_str());
            return false;
        }
        o.positional.push_back(a);
    }

    for (const auto &f : flags)
    {
        unsigned long long n = 0;
        if (f.first == "--chunk-size")
        {
            if (!parse_num(f.second, n) || n == 0)
            {
                std::fprintf(stderr, "error: invalid chunk size: %s\n", f.second.c_str());
                return false;
            }
            chunk_override = static_cast<std::size_t>(n);
        }
    }

    if (!preset.empty())
    {
        auto p = app::preset_by_name(preset, chunk_override);
        if (!p)
        {
            std::fprintf(stderr, "error: unknown preset: %s\n", preset.c_str());
            return false;
        }
        o.cfg = *p;
    }
    app::apply_env(o.cfg);

    for (const auto &f : flags)
    {
        unsigned long long n = 0;
        if (f.first == "--chunk-size")
        {
            o.cfg.chunk_size = chunk_override;
        }
        else if (f.first == "--ecc")
        {
            auto e = app::parse_ecc(f.second);
            if (!e)
            {
                std::fprintf(stderr, "error: invalid ecc level: %s\n", f.second.c_str());
                return false;
            }
            o.cfg.ecc = *e;
        }
        else
        {
            if (!parse_num(f.second, n) || n > 0xFFFFFFFFull)
            {
                std::fprintf(stderr, "error: invalid value for %s: %s\n", f.first.c_str(),
                             f.second.c_str());
                return false;
            }
            if (f.first == "--effort")
                o.cfg.effort = static_cast<int>(n);
            else if (f.first == "--qr-version")
                o.cfg.qr_version = static_cast<int>(n);
            else if (f.first == "--capacity")
                o.cfg.cell_capacity = static_cast<std::size_t>(n);
        }
    }
    if (o.out_dir.empty())
        o.out_dir = constants::output_dir();
    return true;
}

static int cmd_encode(const Options &o)
{
    if (o.positional.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (!app::validate(o.cfg))
        return exitc::bad_args;

    const std::string        &path = o.positional[0];
    std::vector<std::uint8_t> file;
    if (!fileops::read_file(path, file))
        return exitc::io_error;

    const std::string        name = fileops::base_name(path);
    app::ConversionPipeline  pipeline(o.cfg);
    cell::FileCellCodec      codec(o.cfg.cell_capacity);
    std::vector<cell::Image> images;

    const proto::Error rc = pipeline.encode_cells(file, name, codec, images);
    if (rc != proto::Error::None)
    {
        std::fprintf(stderr, "error: encode failed: %s\n", proto::error_name(rc));
        return exit_for(rc);
    }

    for (std::size_t i = 0; i < images.size(); ++i)
    {
        const std::string out = o.out_dir + "/" +
                                fileops::cell_filename(name, i, images.size(),
                                                       std::string(constants::CELL_EXT));
        if (!fileops::write_file(out, images[i]))
            return exitc::io_error;
    }
    std::printf("%s: %zu cell(s) written to %s\n", name.c_str(), images.size(), o.out_dir.c_str());
    return exitc::ok;
}

// 1-based, matching the cell file names
static void print_missing(const std::vector<std::uint32_t> &listed, std::uint64_t count)
{
    if (listed.empty())
        return;
    std::printf("  missing:");
    for (auto m : listed)
        std::printf(" %u", m + 1);
    if (count > listed.size())
        std::printf(" ... (%llu more)", static_cast<unsigned long long>(count - listed.size()));
    std::printf("\n");
}

static bool load_cells(const Options &o, std::vector<cell::Image> &images)
{
    const auto paths = fileops::expand_inputs(o.positional);
    if (paths.empty())
    {
        print_usage();
        return false;
    }
    for (const auto &p : paths)
    {
        cell::Image img;
        if (!fileops::read_file(p, img))
        {
            // unreadable input counts like a failed scan
            LOG_WARN("skipping %s", p.c_str());
            continue;
        }
        images.push_back(std::move(img));
    }
    LOG_DEBUG("loaded %zu of %zu cell file(s)", images.size(), paths.size());
    return true;
}

static int cmd_decode(const Options &o)
{
    std::vector<cell::Image> images;
    if (!load_cells(o, images))
        return exitc::bad_args;

    app::ConversionPipeline pipeline(o.cfg);
    cell::FileCellCodec     codec;
    app::DecodeReport       rep;
    const proto::Error      rc = pipeline.decode_cells(images, codec, rep);

    int                             exit_code = exit_for(rc);
    std::unordered_set<std::string> written;
    for (const auto &t : rep.transfers)
    {
        if (t.status != proto::Error::None)
        {
            std::printf("FAILED %s: %s (%zu/%u chunks)\n", t.id.filename.c_str(),
                        proto::error_name(t.status), t.received, t.total);
            print_missing(t.missing, t.missing_count);
            continue;
        }
        const std::string hex  = digest::to_hex(t.id.digest);
        std::string       name = t.id.filename.empty() ? hex.substr(0, 16)
                                                       : fileops::sanitize_filename(t.id.filename);
        // same name, different content: keep both
        if (!written.insert(name).second)
        {
            name += "." + hex.substr(0, 8);
            written.insert(name);
        }
        const std::string out = o.out_dir + "/" + name;
        if (!fileops::write_file(out, t.data))
        {
            exit_code = exitc::io_error;
            continue;
        }
        std::printf("OK %s (%zu bytes) -> %s\n", t.id.filename.c_str(), t.data.size(), out.c_str());
    }
    if (rep.unreadable || rep.malformed)
        std::printf("skipped: %zu unreadable, %zu malformed\n", rep.unreadable, rep.malformed);
    return exit_code;
}

static int cmd_analyze(const Options &o)
{
    std::vector<cell::Image> images;
    if (!load_cells(o, images))
        return exitc::bad_args;

    app::ConversionPipeline pipeline(o.cfg);
    cell::FileCellCodec     codec;
    const auto              rep = pipeline.analyze_cells(images, codec);

    std::printf("cells: %zu total, %zu readable, %zu unreadable, %zu malformed\n", rep.buffers,
                rep.readable, rep.unreadable, rep.malformed);
    if (rep.transfers.empty())
        return exitc::no_chunks;

    int exit_code = exitc::ok;
    for (const auto &t : rep.transfers)
    {
        std::printf("%s [%s] %zu/%u chunks, %s%s\n", t.id.filename.c_str(),
                    digest::to_hex(t.id.digest).substr(0, 16).c_str(), t.found.size(), t.total,
                    t.complete ? "complete" : "incomplete",
                    t.conflicts ? ", conflicting chunks" : "");
        print_missing(t.missing, t.missing_count);
        if (t.conflicts)
            exit_code = exitc::corrupt;
        else if (!t.complete && exit_code == exitc::ok)
            exit_code = exitc::incomplete;
    }
    return exit_code;
}

static int cmd_estimate(const Options &o)
{
    if (o.positional.size() != 1)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (!app::validate(o.cfg))
        return exitc::bad_args;

    const std::string      &path = o.positional[0];
    const std::string       name = fileops::base_name(path);
    app::ConversionPipeline pipeline(o.cfg);
    app::Estimate           e;

    if (o.exact)
    {
        std::vector<std::uint8_t> file;
        if (!fileops::read_file(path, file))
            return exitc::io_error;
        const proto::Error rc = pipeline.estimate_exact(file, name, e);
        if (rc != proto::Error::None)
            return exit_for(rc);
    }
    else
    {
        std::error_code ec;
        const auto      size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            LOG_ERROR("cannot stat %s: %s", path.c_str(), ec.message().c_str());
            return exitc::io_error;
        }
        e = pipeline.estimate(static_cast<std::uint64_t>(size), name);
    }

    std::printf("%s: %llu bytes -> ~%llu compressed, %zu cell(s) (%s), %llu wire bytes\n",
                name.c_str(), static_cast<unsigned long long>(e.original_size),
                static_cast<unsigned long long>(e.compressed_size), e.chunks,
                e.exact ? "exact" : "estimate", static_cast<unsigned long long>(e.wire_bytes));
    std::printf("config: %s\n", app::summary(o.cfg).c_str());
    return exitc::ok;
}

static int run_cmd(const std::string &cmd, const std::vector<std::string> &args)
{
    Options o;
    if (cmd != "version" && !parse_options(args, o))
    {
        print_usage();
        return exitc::bad_args;
    }

    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"encode", [&]() -> int { return cmd_encode(o); }},
        {"decode", [&]() -> int { return cmd_decode(o); }},
        {"analyze", [&]() -> int { return cmd_analyze(o); }},
        {"estimate", [&]() -> int { return cmd_estimate(o); }},
        {"version",
         [&]() -> int {
             std::printf("qrare %.*s\n", static_cast<int>(constants::VERSION.size()),
                         constants::VERSION.data());
             return exitc::ok;
         }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    qrare::init_log_level_from_env();
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--log-level" && i + 1 < argc)
        {
            qrare::set_log_level_by_name(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    return run_cmd(args[0], args);
}
