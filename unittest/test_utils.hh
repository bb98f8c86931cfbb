#pragma once

#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include "unittest_config.h"

inline const std::string secret_message = "This is where your secret message will be!";
inline constexpr std::uint32_t secret_crc = 2882656334u;

inline void append_u32be(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(std::byte(v >> 24));
    out.push_back(std::byte(v >> 16));
    out.push_back(std::byte(v >> 8));
    out.push_back(std::byte(v));
}

inline void append_text(std::vector<std::byte>& out, std::string_view s) {
    for (char c : s) {
        out.push_back(std::byte(c));
    }
}

inline std::vector<std::byte> to_bytes(std::string_view s) {
    std::vector<std::byte> out;
    append_text(out, s);
    return out;
}

inline std::vector<std::byte> to_bytes(std::initializer_list<unsigned> values) {
    std::vector<std::byte> out;
    for (auto v : values) {
        out.push_back(std::byte(v));
    }
    return out;
}

// Hand-assembled chunk record: no validation, any checksum
inline std::vector<std::byte> raw_chunk(std::uint32_t length, std::string_view tag,
                                        std::string_view payload, std::uint32_t crc) {
    std::vector<std::byte> out;
    append_u32be(out, length);
    append_text(out, tag);
    append_text(out, payload);
    append_u32be(out, crc);
    return out;
}

inline std::vector<std::byte> png_signature() {
    return to_bytes({0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A});
}

// IHDR for a 1x1 greyscale image, with its real checksum
inline std::vector<std::byte> ihdr_chunk() {
    std::vector<std::byte> out;
    append_u32be(out, 13);
    append_text(out, "IHDR");
    auto body = to_bytes({0, 0, 0, 1, 0, 0, 0, 1, 8, 0, 0, 0, 0});
    out.insert(out.end(), body.begin(), body.end());
    append_u32be(out, 981375829u);
    return out;
}

inline std::vector<std::byte> iend_chunk() {
    return raw_chunk(0, "IEND", "", 0xAE426082u);
}

// Signature, IHDR, a RuSt chunk carrying the secret message, IEND
inline std::vector<std::byte> sample_png() {
    auto out = png_signature();
    auto ihdr = ihdr_chunk();
    auto rust = raw_chunk(42, "RuSt", secret_message, secret_crc);
    auto iend = iend_chunk();
    out.insert(out.end(), ihdr.begin(), ihdr.end());
    out.insert(out.end(), rust.begin(), rust.end());
    out.insert(out.end(), iend.begin(), iend.end());
    return out;
}

inline std::filesystem::path scratch_path(const std::string& name) {
    static std::filesystem::path root(UNITTEST_PATH_TO_SCRATCH_FILES);
    std::filesystem::create_directories(root);
    return root / name;
}
