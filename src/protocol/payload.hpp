#pragma once

#include <nlohmann/json.hpp>

namespace terrastream::protocol {

/**
 * Payload value carried inside a frame, packed as MessagePack on the wire.
 *
 * A full grid is an array of rows, each row an array of numbers. Deltas are
 * objects (changed key -> new value), arrays of {index, value} records, or a
 * literal replacement value.
 *
 * null is reserved: it marks a deleted key or a removed sequence tail and
 * never appears in a grid. The empty object is the "no change" value.
 */
using Payload = nlohmann::json;

inline Payload no_change() {
    return Payload::object();
}

inline bool is_no_change(const Payload& payload) {
    return payload.is_object() && payload.empty();
}

} // namespace terrastream::protocol
