#pragma once

#include <algorithm>
#include <array>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/udp.hpp>
#include "common/protocol.hpp"

namespace agora::wire {

// ============================================================================
// Wire Encoding
// ============================================================================
// | Type          | Encoding                              |
// |---------------|---------------------------------------|
// | uint8..uint64 | Big Endian                            |
// | string, bytes | 2-byte length prefix + data           |
// | list          | 2-byte element count + elements       |
// | address       | 1 byte family (4|6) + 4 or 16 bytes   |
// | endpoint      | address + 2-byte port                 |
// | padding       | zero bytes up to the next boundary    |
// ============================================================================

inline constexpr size_t MAX_PREFIXED_LENGTH = 0xFFFF;

constexpr size_t aligned_size(size_t length, size_t boundary) {
    return (length + boundary - 1) / boundary * boundary;
}

// ============================================================================
// BinaryWriter
// ============================================================================
class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve_size) {
        buffer_.reserve(reserve_size);
    }

    void write_u8(uint8_t value) { buffer_.push_back(value); }
    void write_u16(uint16_t value) { put(value); }
    void write_u32(uint32_t value) { put(value); }
    void write_u64(uint64_t value) { put(value); }

    // Longer input is cut at MAX_PREFIXED_LENGTH
    void write_string(std::string_view str) {
        auto len = std::min(str.size(), MAX_PREFIXED_LENGTH);
        write_u16(static_cast<uint16_t>(len));
        buffer_.insert(buffer_.end(), str.begin(), str.begin() + len);
    }

    void write_bytes(std::span<const uint8_t> data) {
        auto len = std::min(data.size(), MAX_PREFIXED_LENGTH);
        write_u16(static_cast<uint16_t>(len));
        buffer_.insert(buffer_.end(), data.begin(), data.begin() + len);
    }

    // No length prefix
    void write_fixed_bytes(std::span<const uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    void write_array_header(uint16_t count) { write_u16(count); }

    void write_address(const boost::asio::ip::address& addr);
    void write_endpoint(const boost::asio::ip::udp::endpoint& ep);

    // Zero-fill up to a multiple of `boundary` counted from `start`
    void write_padding(size_t boundary, size_t start = 0) {
        auto used = buffer_.size() - start;
        buffer_.resize(start + aligned_size(used, boundary), 0);
    }

    std::vector<uint8_t>& data() { return buffer_; }
    const std::vector<uint8_t>& data() const { return buffer_; }
    std::vector<uint8_t> take() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    template<std::unsigned_integral T>
    void put(T value) {
        for (int shift = (sizeof(T) - 1) * 8; shift >= 0; shift -= 8) {
            buffer_.push_back(static_cast<uint8_t>(value >> shift));
        }
    }

    std::vector<uint8_t> buffer_;
};

// ============================================================================
// BinaryReader
// ============================================================================
// Every read fails with INVALID_MESSAGE on truncated input and leaves the
// position unchanged in that case.
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data)
        : data_(data) {}

    bool has_remaining(size_t count) const { return count <= data_.size() - pos_; }
    size_t remaining() const { return data_.size() - pos_; }
    size_t position() const { return pos_; }

    std::expected<uint8_t, ErrorCode> read_u8() { return get<uint8_t>(); }
    std::expected<uint16_t, ErrorCode> read_u16() { return get<uint16_t>(); }
    std::expected<uint32_t, ErrorCode> read_u32() { return get<uint32_t>(); }
    std::expected<uint64_t, ErrorCode> read_u64() { return get<uint64_t>(); }

    std::expected<std::string, ErrorCode> read_string() {
        auto bytes = read_bytes();
        if (!bytes) return std::unexpected(bytes.error());
        return std::string(bytes->begin(), bytes->end());
    }

    std::expected<std::vector<uint8_t>, ErrorCode> read_bytes() {
        if (!has_remaining(2)) return std::unexpected(ErrorCode::INVALID_MESSAGE);
        size_t len = (static_cast<size_t>(data_[pos_]) << 8) | data_[pos_ + 1];
        if (!has_remaining(2 + len)) return std::unexpected(ErrorCode::INVALID_MESSAGE);
        pos_ += 2;
        return read_fixed_bytes(len);
    }

    std::expected<std::vector<uint8_t>, ErrorCode> read_fixed_bytes(size_t count) {
        if (!has_remaining(count)) return std::unexpected(ErrorCode::INVALID_MESSAGE);
        auto first = data_.begin() + pos_;
        pos_ += count;
        return std::vector<uint8_t>(first, first + count);
    }

    template<size_t N>
    std::expected<std::array<uint8_t, N>, ErrorCode> read_fixed_array() {
        if (!has_remaining(N)) return std::unexpected(ErrorCode::INVALID_MESSAGE);
        std::array<uint8_t, N> arr;
        std::memcpy(arr.data(), data_.data() + pos_, N);
        pos_ += N;
        return arr;
    }

    std::expected<uint16_t, ErrorCode> read_array_header() { return read_u16(); }

    std::expected<boost::asio::ip::address, ErrorCode> read_address();
    std::expected<boost::asio::ip::udp::endpoint, ErrorCode> read_endpoint();

    bool skip(size_t count) {
        if (!has_remaining(count)) return false;
        pos_ += count;
        return true;
    }

    // Counterpart of BinaryWriter::write_padding
    bool skip_padding(size_t boundary, size_t start = 0) {
        auto used = pos_ - start;
        return skip(aligned_size(used, boundary) - used);
    }

private:
    template<std::unsigned_integral T>
    std::expected<T, ErrorCode> get() {
        if (!has_remaining(sizeof(T))) return std::unexpected(ErrorCode::INVALID_MESSAGE);
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

} // namespace agora::wire
