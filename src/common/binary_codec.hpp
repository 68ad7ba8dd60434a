#pragma once

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <expected>
#include <array>

namespace peerdrop::wire {

// ============================================================================
// Binary Encoding Rules (blob transport and tickets)
// ============================================================================
// | Type          | Encoding                              |
// |---------------|---------------------------------------|
// | uint8/16/64   | Big Endian                            |
// | string        | 2-byte length prefix + UTF-8 data     |
// | fixed bytes   | raw, length known from context        |
// | array         | 2-byte element count + elements       |
// ============================================================================

enum class CodecError {
    TRUNCATED,
    INVALID_ENCODING,
};

std::string codec_error_message(CodecError error);

// ============================================================================
// BinaryWriter - appends big-endian fields to an owned buffer
// ============================================================================
class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve_size) { buffer_.reserve(reserve_size); }

    void write_u8(uint8_t value) { buffer_.push_back(value); }
    void write_u16(uint16_t value) { put_be(value); }
    void write_u64(uint64_t value) { put_be(value); }

    // Longer strings are cut at 0xFFFF bytes
    void write_string(std::string_view str) {
        auto len = static_cast<uint16_t>(std::min<size_t>(str.size(), 0xFFFF));
        write_u16(len);
        buffer_.insert(buffer_.end(), str.begin(), str.begin() + len);
    }

    void write_fixed_bytes(std::span<const uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    void write_array_header(uint16_t count) { write_u16(count); }

    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    template<typename T>
    void put_be(T value) {
        for (size_t i = sizeof(T); i-- > 0;) {
            buffer_.push_back(static_cast<uint8_t>(value >> (i * 8)));
        }
    }

    std::vector<uint8_t> buffer_;
};

// ============================================================================
// BinaryReader - non-owning cursor; every read fails with TRUNCATED at the end
// ============================================================================
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data) : data_(data) {}

    size_t remaining() const { return data_.size() - pos_; }

    std::expected<uint8_t, CodecError> read_u8() { return get_be<uint8_t>(); }
    std::expected<uint16_t, CodecError> read_u16() { return get_be<uint16_t>(); }
    std::expected<uint64_t, CodecError> read_u64() { return get_be<uint64_t>(); }

    std::expected<std::string, CodecError> read_string() {
        auto len = read_u16();
        if (!len) return std::unexpected(len.error());
        if (remaining() < *len) return std::unexpected(CodecError::TRUNCATED);

        std::string str(reinterpret_cast<const char*>(data_.data() + pos_), *len);
        pos_ += *len;
        return str;
    }

    template<size_t N>
    std::expected<std::array<uint8_t, N>, CodecError> read_fixed_array() {
        if (remaining() < N) return std::unexpected(CodecError::TRUNCATED);

        std::array<uint8_t, N> arr;
        std::memcpy(arr.data(), data_.data() + pos_, N);
        pos_ += N;
        return arr;
    }

    std::expected<uint16_t, CodecError> read_array_header() { return read_u16(); }

private:
    template<typename T>
    std::expected<T, CodecError> get_be() {
        if (remaining() < sizeof(T)) return std::unexpected(CodecError::TRUNCATED);

        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value = static_cast<T>((value << 8) | data_[pos_ + i]);
        }
        pos_ += sizeof(T);
        return value;
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

// ============================================================================
// Text encodings used by tickets and file names
// ============================================================================

// RFC 4648 base32, lowercase, no padding
std::string base32_encode(std::span<const uint8_t> data);
std::expected<std::vector<uint8_t>, CodecError> base32_decode(std::string_view text);

std::string hex_encode(std::span<const uint8_t> data);

} // namespace peerdrop::wire
