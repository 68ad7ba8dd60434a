#include "common/binary_codec.hpp"

namespace peerdrop::wire {

namespace {

constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";

int base32_value(char c) {
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

} // anonymous namespace

std::string codec_error_message(CodecError error) {
    switch (error) {
        case CodecError::TRUNCATED: return "Unexpected end of data";
        case CodecError::INVALID_ENCODING: return "Invalid encoding";
        default: return "Unknown codec error";
    }
}

// ============================================================================
// Base32
// ============================================================================

std::string base32_encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    return out;
}

std::expected<std::vector<uint8_t>, CodecError> base32_decode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int value = base32_value(c);
        if (value < 0) {
            return std::unexpected(CodecError::INVALID_ENCODING);
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }

    // Leftover bits must be zero padding from the encoder
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
        return std::unexpected(CodecError::INVALID_ENCODING);
    }
    return out;
}

std::string hex_encode(std::span<const uint8_t> data) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

} // namespace peerdrop::wire
