#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace bk::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    if (size < 0) throw std::runtime_error("Failed to stat file: " + path.string());
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (size > 0 && !in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

// Rejects empty paths, absolute paths and any ".." component.
inline bool isSafeRelativePath(const std::filesystem::path& rel) {
    if (rel.empty() || rel.is_absolute()) return false;
    for (const auto& part : rel)
        if (part == "..") return false;
    return true;
}

}
