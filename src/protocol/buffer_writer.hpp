#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace terrastream::protocol {

// Lightweight buffer writer with two modes:
//   BufferWriter(span) - fixed buffer, bounds-checked, no allocations
//   BufferWriter(vec)  - append mode, grows the vector on each write
//
// write() stores values in host (little-endian) order, write_be() in network order.
class BufferWriter {
    uint8_t* data_ = nullptr;
    size_t capacity_ = 0;
    size_t offset_ = 0;
    std::vector<uint8_t>* vec_ = nullptr;  // null for span mode

    void ensure(size_t n) {
        if (vec_) {
            if (vec_->size() < offset_ + n) {
                vec_->resize(offset_ + n);
            }
            data_ = vec_->data();
            capacity_ = vec_->size();
        } else if (offset_ + n > capacity_) {
            throw std::out_of_range("BufferWriter: write past end of buffer");
        }
    }

public:
    // Span mode: fixed buffer, bounds-checked
    explicit BufferWriter(std::span<uint8_t> buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(0), vec_(nullptr) {}

    // Append mode: grows the vector on each write
    explicit BufferWriter(std::vector<uint8_t>& buf)
        : data_(buf.data()), capacity_(buf.size()), offset_(buf.size()), vec_(&buf) {}

    template<typename T>
    void write(const T& val) {
        static_assert(std::is_trivially_copyable_v<T>);
        ensure(sizeof(T));
        std::memcpy(data_ + offset_, &val, sizeof(T));
        offset_ += sizeof(T);
    }

    // Big-endian integer (wire headers and frame length prefix)
    template<typename T>
    void write_be(T val) {
        static_assert(std::is_integral_v<T>);
        using U = std::make_unsigned_t<T>;
        U u = static_cast<U>(val);
        ensure(sizeof(T));
        for (size_t i = 0; i < sizeof(T); ++i) {
            data_[offset_ + i] = static_cast<uint8_t>(u >> (8 * (sizeof(T) - 1 - i)));
        }
        offset_ += sizeof(T);
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        ensure(bytes.size());
        if (!bytes.empty()) {
            std::memcpy(data_ + offset_, bytes.data(), bytes.size());
        }
        offset_ += bytes.size();
    }

    size_t offset() const { return offset_; }
};

} // namespace terrastream::protocol
