#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "util/file_ops.hpp"
#include "util/log.hpp"

namespace fileops
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &path)
{
    std::error_code ec;
    fs::path        p(path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // file in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    return true;
}

bool read_file(const std::string &path, std::vector<std::uint8_t> &out)
{
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        LOG_ERROR("cannot open %s for reading", path.c_str());
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        LOG_ERROR("read error on %s", path.c_str());
        return false;
    }
    return true;
}

bool write_file(const std::string &path, const std::vector<std::uint8_t> &data)
{
    if (!ensure_parent_dir(path))
        return false;
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        LOG_ERROR("cannot open %s for writing", path.c_str());
        return false;
    }
    if (!data.empty())
        ofs.write(reinterpret_cast<const char *>(data.data()),
                  static_cast<std::streamsize>(data.size()));
    ofs.flush();
    if (!ofs)
    {
        LOG_ERROR("write error on %s", path.c_str());
        return false;
    }
    return true;
}

std::string expand_user(const std::string &path)
{
    if (path.empty() || path[0] != '~')
        return path;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return path;
    return std::string(home) + path.substr(1);
}

std::string base_name(const std::string &path)
{
    return fs::path(path).filename().string();
}

std::string sanitize_filename(const std::string &name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        const unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || c == '/' || c == '\\' || c == ':' || c == '*' || c == '?' || c == '"' ||
            c == '<' || c == '>' || c == '|')
            out.push_back('_');
        else
            out.push_back(c);
    }
    // no hidden or relative names
    while (!out.empty() && out.front() == '.')
        out.erase(out.begin());
    if (out.empty())
        out = "unnamed";
    return out;
}

std::string cell_filename(const std::string &name,
                          std::size_t        index,
                          std::size_t        total,
                          const std::string &ext)
{
    const std::size_t width = std::to_string(total).size();
    std::string       num   = std::to_string(index + 1);
    if (num.size() < width)
        num.insert(0, width - num.size(), '0');
    return sanitize_filename(name) + "_chunk_" + num + "_of_" + std::to_string(total) + ext;
}

std::vector<std::string> expand_inputs(const std::vector<std::string> &args)
{
    std::vector<std::string> out;
    for (const auto &a : args)
    {
        std::error_code ec;
        const fs::path  p(expand_user(a));
        if (fs::is_directory(p, ec))
        {
            std::vector<std::string> files;
            for (const auto &e : fs::directory_iterator(p, ec))
            {
                if (e.is_regular_file(ec))
                    files.push_back(e.path().string());
            }
            if (ec)
                LOG_WARN("listing %s: %s", p.string().c_str(), ec.message().c_str());
            std::sort(files.begin(), files.end());
            out.insert(out.end(), files.begin(), files.end());
        }
        else
        {
            out.push_back(p.string());
        }
    }
    return out;
}

}  // namespace fileops
