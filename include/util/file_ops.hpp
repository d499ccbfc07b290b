#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace fileops
{

bool read_file(const std::string &path, std::vector<std::uint8_t> &out);
// Creates missing parent directories.
bool write_file(const std::string &path, const std::vector<std::uint8_t> &data);

std::string expand_user(const std::string &path);
std::string base_name(const std::string &path);

// Replace characters that are unsafe in file names; never returns empty.
std::string sanitize_filename(const std::string &name);

// "<name>_chunk_<i+1, zero padded to width of total>_of_<total><ext>"
std::string cell_filename(const std::string &name,
                          std::size_t        index,
                          std::size_t        total,
                          const std::string &ext);

// Regular files as given; directories replaced by their regular files, sorted.
std::vector<std::string> expand_inputs(const std::vector<std::string> &args);

}  // namespace fileops
