#ifndef CODEGAUGE_UTILS_FILESYSTEM_HPP
#define CODEGAUGE_UTILS_FILESYSTEM_HPP

#pragma once

#include <string>

namespace codegauge::utils {

// Reads the whole file as bytes. Throws std::runtime_error when the
// file cannot be opened or is not a regular file.
std::string read_file_content(const std::string &file_path);

bool is_regular_file(const std::string &path);

std::string normalize_path(const std::string &path);

} // namespace codegauge::utils

#endif // CODEGAUGE_UTILS_FILESYSTEM_HPP
