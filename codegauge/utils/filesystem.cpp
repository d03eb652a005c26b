#include "filesystem.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace codegauge::utils {

namespace fs = std::filesystem;

std::string read_file_content(const std::string &file_path) {
    if (!is_regular_file(file_path)) {
        throw std::runtime_error("Not a regular file: " + file_path);
    }

    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + file_path);
    }
    return buffer.str();
}

bool is_regular_file(const std::string &path) {
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

std::string normalize_path(const std::string &path) {
    return fs::path(path).lexically_normal().string();
}

} // namespace codegauge::utils
