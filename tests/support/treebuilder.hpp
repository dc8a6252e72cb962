#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace cleanbook::testing {

namespace fs = std::filesystem;

// Write a file of the given size, creating parent directories
inline void writeFile(const fs::path& path, size_t bytes, char fill = 'x') {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::string chunk(64 * 1024, fill);
    while (bytes > 0) {
        size_t n = bytes < chunk.size() ? bytes : chunk.size();
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        bytes -= n;
    }
}

constexpr size_t MB = 1024 * 1024;

} // namespace cleanbook::testing
