#pragma once

#include "protocol/payload.hpp"

namespace terrastream::protocol {

// Keys of a sequence delta record: {index: i, value: v}
constexpr const char* DELTA_INDEX_KEY = "index";
constexpr const char* DELTA_VALUE_KEY = "value";

/**
 * Minimal description of the change from old_value to new_value.
 *
 *   object, object -> object of changed/added keys to their new value,
 *                     removed keys mapped to null
 *   array, array   -> array of {index, value} records for changed or
 *                     appended positions; positions past the end of a
 *                     shorter new array get value null
 *   otherwise      -> new_value itself
 *
 * Whenever nothing differs the result is no_change() (the empty object).
 */
Payload compute_delta(const Payload& old_value, const Payload& new_value);

/**
 * Reconstructs the newer value from old_value and a delta produced by
 * compute_delta. The no-change value returns old_value unchanged.
 *
 * Sequence records overwrite positions inside the array, append at the
 * current end, and truncate the array at the lowest index whose value is
 * null. Records pointing further past the end are ignored.
 */
Payload apply_delta(const Payload& old_value, const Payload& delta);

// Number of changed entries a delta carries; a literal replacement counts as 1
size_t delta_entry_count(const Payload& delta);

} // namespace terrastream::protocol
