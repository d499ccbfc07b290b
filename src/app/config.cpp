#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include "app/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace app
{

static bool parse_ull(const char *s, unsigned long long &out)
{
    if (!s || !*s || *s == '-')
        return false;
    errno     = 0;
    char *end = nullptr;
    out       = std::strtoull(s, &end, 10);
    return errno == 0 && end && *end == '\0';
}

Config fast_config(std::size_t chunk_size)
{
    Config c;
    c.chunk_size = chunk_size ? chunk_size : 2048;
    c.effort     = 3;
    c.ecc        = Ecc::L;
    c.qr_version = 20;
    return c;
}

Config compact_config(std::size_t chunk_size)
{
    Config c;
    c.chunk_size = chunk_size ? chunk_size : 512;
    c.effort     = 9;
    c.ecc        = Ecc::L;
    c.qr_version = 40;
    return c;
}

Config robust_config(std::size_t chunk_size)
{
    Config c;
    c.chunk_size = chunk_size ? chunk_size : 512;
    c.effort     = 9;
    c.ecc        = Ecc::H;
    c.qr_version = 30;
    return c;
}

std::optional<Config> preset_by_name(std::string_view name, std::size_t chunk_size)
{
    if (name == "fast")
        return fast_config(chunk_size);
    if (name == "compact")
        return compact_config(chunk_size);
    if (name == "robust")
        return robust_config(chunk_size);
    LOG_ERROR("unknown preset '%.*s' (expected fast, compact or robust)",
              static_cast<int>(name.size()), name.data());
    return std::nullopt;
}

bool validate(const Config &c)
{
    bool ok = true;
    if (c.chunk_size < constants::MIN_CHUNK || c.chunk_size > constants::MAX_CHUNK)
    {
        LOG_ERROR("chunk_size must be %zu..%zu, got %zu", constants::MIN_CHUNK,
                  constants::MAX_CHUNK, c.chunk_size);
        ok = false;
    }
    if (c.effort < 0 || c.effort > constants::MAX_EFFORT)
    {
        LOG_ERROR("effort must be 0..%d, got %d", constants::MAX_EFFORT, c.effort);
        ok = false;
    }
    if (c.qr_version < constants::MIN_QR_VER || c.qr_version > constants::MAX_QR_VER)
    {
        LOG_ERROR("qr_version must be %d..%d, got %d", constants::MIN_QR_VER,
                  constants::MAX_QR_VER, c.qr_version);
        ok = false;
    }
    if (static_cast<unsigned>(c.ecc) > static_cast<unsigned>(Ecc::H))
    {
        LOG_ERROR("ecc must be one of L, M, Q, H");
        ok = false;
    }
    return ok;
}

void apply_env(Config &c)
{
    unsigned long long v = 0;
    if (const char *s = std::getenv("QRARE_CHUNK_SIZE"))
    {
        if (parse_ull(s, v))
            c.chunk_size = static_cast<std::size_t>(v);
        else
            LOG_WARN("ignoring QRARE_CHUNK_SIZE='%s'", s);
    }
    if (const char *s = std::getenv("QRARE_EFFORT"))
    {
        if (parse_ull(s, v) && v <= static_cast<unsigned long long>(constants::MAX_EFFORT))
            c.effort = static_cast<int>(v);
        else
            LOG_WARN("ignoring QRARE_EFFORT='%s'", s);
    }
    if (const char *s = std::getenv("QRARE_QR_VERSION"))
    {
        if (parse_ull(s, v) && v <= static_cast<unsigned long long>(constants::MAX_QR_VER))
            c.qr_version = static_cast<int>(v);
        else
            LOG_WARN("ignoring QRARE_QR_VERSION='%s'", s);
    }
    if (const char *s = std::getenv("QRARE_ECC"))
    {
        if (auto e = parse_ecc(s))
            c.ecc = *e;
        else
            LOG_WARN("ignoring QRARE_ECC='%s'", s);
    }
    if (const char *s = std::getenv("QRARE_CELL_CAPACITY"))
    {
        if (parse_ull(s, v))
            c.cell_capacity = static_cast<std::size_t>(v);
        else
            LOG_WARN("ignoring QRARE_CELL_CAPACITY='%s'", s);
    }
}

const char *ecc_name(Ecc e)
{
    switch (e)
    {
        case Ecc::L:
            return "L";
        case Ecc::M:
            return "M";
        case Ecc::Q:
            return "Q";
        case Ecc::H:
            return "H";
    }
    return "?";
}

std::optional<Ecc> parse_ecc(std::string_view s)
{
    if (s == "L" || s == "l" || s == "low")
        return Ecc::L;
    if (s == "M" || s == "m" || s == "medium")
        return Ecc::M;
    if (s == "Q" || s == "q" || s == "quartile")
        return Ecc::Q;
    if (s == "H" || s == "h" || s == "high")
        return Ecc::H;
    return std::nullopt;
}

std::string summary(const Config &c)
{
    char buf[160];
    std::snprintf(buf, sizeof buf, "chunk=%zu effort=%d version=%d ecc=%s capacity=", c.chunk_size,
                  c.effort, c.qr_version, ecc_name(c.ecc));
    std::string out = buf;
    out += c.cell_capacity ? std::to_string(c.cell_capacity) : std::string("unchecked");
    return out;
}

}  // namespace app
