#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace tl::util {

inline std::string readFileToString(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(static_cast<size_t>(size), '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

inline std::string generate_random_suffix(const size_t length = 8) {
    static constexpr char charset[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string s;
    s.reserve(length);
    for (size_t i = 0; i < length; ++i) s.push_back(charset[dist(rng)]);
    return s;
}

// Readers see either the old file or the complete new one.
inline void writeFileAtomic(const std::filesystem::path& path, const std::string_view data) {
    std::filesystem::create_directories(path.parent_path());
    const auto tmp = path.parent_path() / (path.filename().string() + ".tmp-" + generate_random_suffix());

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("Failed to open temp file: " + tmp.string());
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw std::runtime_error("Failed to replace " + path.string() + ": " + ec.message());
    }
}

}
