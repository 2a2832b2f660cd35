#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <type_traits>

namespace terrastream::protocol {

// Lightweight buffer reader with bounds checking via std::span
class BufferReader {
    std::span<const uint8_t> data_;
    size_t offset_ = 0;

    void check_bounds(size_t n) const {
        if (n > data_.size() - offset_) {
            throw std::out_of_range("BufferReader: read past end of buffer");
        }
    }

public:
    BufferReader(std::span<const uint8_t> data) : data_(data) {}

    template<typename T>
    T read() {
        static_assert(std::is_trivially_copyable_v<T>);
        check_bounds(sizeof(T));
        T val;
        std::memcpy(&val, data_.data() + offset_, sizeof(T));
        offset_ += sizeof(T);
        return val;
    }

    // Big-endian integer (wire headers and frame length prefix)
    template<typename T>
    T read_be() {
        static_assert(std::is_integral_v<T>);
        using U = std::make_unsigned_t<T>;
        check_bounds(sizeof(T));
        U u = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            u = static_cast<U>((u << 8) | data_[offset_ + i]);
        }
        offset_ += sizeof(T);
        return static_cast<T>(u);
    }

    size_t offset() const { return offset_; }
    size_t remaining_size() const { return data_.size() - offset_; }
    std::span<const uint8_t> remaining() const { return data_.subspan(offset_); }
};

} // namespace terrastream::protocol
