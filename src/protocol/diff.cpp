#include "diff.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>

namespace terrastream::protocol {

namespace {

Payload make_record(size_t index, const Payload& value) {
    Payload record = Payload::object();
    record[DELTA_INDEX_KEY] = index;
    record[DELTA_VALUE_KEY] = value;
    return record;
}

Payload compute_object_delta(const Payload& old_obj, const Payload& new_obj) {
    Payload delta = Payload::object();
    for (const auto& [key, value] : new_obj.items()) {
        auto it = old_obj.find(key);
        if (it == old_obj.end() || *it != value) {
            delta[key] = value;
        }
    }
    for (const auto& [key, value] : old_obj.items()) {
        if (!new_obj.contains(key)) {
            delta[key] = nullptr;
        }
    }
    return delta;
}

Payload compute_sequence_delta(const Payload& old_seq, const Payload& new_seq) {
    Payload records = Payload::array();
    size_t common = std::min(old_seq.size(), new_seq.size());
    for (size_t i = 0; i < common; ++i) {
        if (old_seq[i] != new_seq[i]) {
            records.push_back(make_record(i, new_seq[i]));
        }
    }
    for (size_t i = common; i < new_seq.size(); ++i) {
        records.push_back(make_record(i, new_seq[i]));
    }
    // Shrink: null-valued records mark the removed tail
    for (size_t i = common; i < old_seq.size(); ++i) {
        records.push_back(make_record(i, nullptr));
    }
    if (records.empty()) {
        return no_change();
    }
    return records;
}

Payload apply_object_delta(const Payload& old_obj, const Payload& delta) {
    Payload result = old_obj;
    for (const auto& [key, value] : delta.items()) {
        if (value.is_null()) {
            result.erase(key);
        } else {
            result[key] = value;
        }
    }
    return result;
}

std::optional<size_t> record_index(const Payload& record) {
    auto index = record.find(DELTA_INDEX_KEY);
    if (index == record.end() || !index->is_number_integer() || index->get<int64_t>() < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(index->get<int64_t>());
}

Payload apply_sequence_delta(const Payload& old_seq, const Payload& records) {
    Payload result = old_seq;
    std::optional<size_t> truncate_at;

    for (const auto& record : records) {
        if (!record.is_object()) continue;
        auto index = record_index(record);
        auto value = record.find(DELTA_VALUE_KEY);
        if (!index || value == record.end()) continue;

        if (value->is_null()) {
            truncate_at = std::min(truncate_at.value_or(*index), *index);
        } else if (*index < result.size()) {
            result[*index] = *value;
        } else if (*index == result.size()) {
            result.push_back(*value);
        }
    }

    if (truncate_at && *truncate_at < result.size()) {
        result.erase(result.begin() + static_cast<std::ptrdiff_t>(*truncate_at), result.end());
    }
    return result;
}

} // namespace

Payload compute_delta(const Payload& old_value, const Payload& new_value) {
    if (old_value.is_object() && new_value.is_object()) {
        // An empty result doubles as the no-change value
        return compute_object_delta(old_value, new_value);
    }
    if (old_value.is_array() && new_value.is_array()) {
        return compute_sequence_delta(old_value, new_value);
    }
    if (old_value != new_value) {
        return new_value;
    }
    return no_change();
}

Payload apply_delta(const Payload& old_value, const Payload& delta) {
    if (is_no_change(delta)) {
        return old_value;
    }
    if (old_value.is_object() && delta.is_object()) {
        return apply_object_delta(old_value, delta);
    }
    if (old_value.is_array() && delta.is_array()) {
        return apply_sequence_delta(old_value, delta);
    }
    return delta;
}

size_t delta_entry_count(const Payload& delta) {
    if (delta.is_object() || delta.is_array()) return delta.size();
    return 1;
}

} // namespace terrastream::protocol
