#pragma once

#include "protocol/buffer_reader.hpp"
#include "protocol/buffer_writer.hpp"
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace terrastream::protocol {

// CRTP base for fixed-size wire records (the request header).
// Derived must implement:
//   static constexpr size_t serialized_size()
//   void serialize_impl(BufferWriter& w) const
//   void deserialize_impl(BufferReader& r)
template<typename Derived>
struct Serializable {
    // Serialize into a fixed span (bounds-checked, no allocation)
    void serialize(std::span<uint8_t> buf) const {
        BufferWriter w(buf);
        static_cast<const Derived*>(this)->serialize_impl(w);
    }

    // Deserialize from the front of a span; extra bytes are left unread
    void deserialize(std::span<const uint8_t> data) {
        BufferReader r(data);
        static_cast<Derived*>(this)->deserialize_impl(r);
    }

    auto to_bytes() const {
        std::array<uint8_t, Derived::serialized_size()> buf{};
        serialize(buf);
        return buf;
    }

    // Exactly serialized_size() bytes, otherwise std::length_error
    static Derived from_bytes(std::span<const uint8_t> data) {
        if (data.size() != Derived::serialized_size()) {
            throw std::length_error("record needs " + std::to_string(Derived::serialized_size())
                                    + " bytes, got " + std::to_string(data.size()));
        }
        Derived record;
        record.deserialize(data);
        return record;
    }
};

} // namespace terrastream::protocol
