#pragma once

/// @file rpc_buffer.hpp
/// @brief Byte buffers for RPC serialization
///
/// buffer_writer appends values to a growable byte vector; buffer_view reads
/// them back from a received frame without copying. Fixed-size values are
/// stored in host (little-endian) order, variable-length data carries a
/// uint32 length prefix. Every out-of-bounds access throws marshaling_error.

#include "rpc_error.hpp"

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <type_traits>

namespace scrpc::rpc {

/// A view into serialized data for zero-copy reading
class buffer_view {
public:
    buffer_view() noexcept = default;

    buffer_view(const void* data, size_t size) noexcept
        : data_(static_cast<const uint8_t*>(data))
        , size_(size) {}

    buffer_view(std::span<const uint8_t> span) noexcept
        : data_(span.data()), size_(span.size()) {}

    /// True for a view over no bytes at all
    bool empty() const noexcept { return size_ == 0; }

    /// Get remaining bytes from current position
    size_t remaining() const noexcept { return size_ - pos_; }

    /// Read a fixed-size value
    template<typename T>
    requires std::is_trivially_copyable_v<T>
    T read() {
        if (sizeof(T) > remaining()) {
            throw marshaling_error("read past end of buffer");
        }
        T value;
        std::memcpy(&value, data_ + pos_, sizeof(T));
        pos_ += sizeof(T);
        return value;
    }

    /// Read a length-prefixed string view (zero-copy)
    std::string_view read_string() {
        uint32_t len = read<uint32_t>();
        if (len > remaining()) {
            throw marshaling_error("string length exceeds buffer");
        }
        std::string_view result(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return result;
    }

    /// Read array count (for variable-length containers)
    uint32_t read_array_size() {
        return read<uint32_t>();
    }

private:
    const uint8_t* data_ = nullptr;
    size_t size_ = 0;
    size_t pos_ = 0;
};

/// A writable buffer for serialization
class buffer_writer {
public:
    explicit buffer_writer(size_t initial_capacity = 256) {
        data_.reserve(initial_capacity);
    }

    size_t size() const noexcept { return data_.size(); }

    const uint8_t* data() const noexcept { return data_.data(); }

    std::span<const uint8_t> span() const noexcept { return data_; }

    /// Write a fixed-size value
    template<typename T>
    requires std::is_trivially_copyable_v<T>
    void write(T value) {
        size_t old_size = data_.size();
        data_.resize(old_size + sizeof(T));
        std::memcpy(data_.data() + old_size, &value, sizeof(T));
    }

    /// Write raw bytes
    void write_bytes(const void* src, size_t n) {
        if (n == 0) {
            return;
        }
        size_t old_size = data_.size();
        data_.resize(old_size + n);
        std::memcpy(data_.data() + old_size, src, n);
    }

    void write_bytes(std::string_view src) {
        write_bytes(src.data(), src.size());
    }

    /// Write a length-prefixed string
    void write_string(std::string_view str) {
        if (str.size() > UINT32_MAX) {
            throw marshaling_error("string too long");
        }
        write(static_cast<uint32_t>(str.size()));
        write_bytes(str.data(), str.size());
    }

    /// Write array size prefix
    void write_array_size(size_t count) {
        if (count > UINT32_MAX) {
            throw marshaling_error("container too large");
        }
        write(static_cast<uint32_t>(count));
    }

    /// Get buffer view for reading what was written
    buffer_view view() const noexcept {
        return buffer_view(data_.data(), data_.size());
    }

private:
    std::vector<uint8_t> data_;
};

} // namespace scrpc::rpc
