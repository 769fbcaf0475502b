#ifndef JSONDELTA_DELTA_DIFF_HPP
#define JSONDELTA_DELTA_DIFF_HPP

#include <jsondelta/config.hpp>
#include <jsondelta/delta/change.hpp>
#include <jsondelta/delta/path.hpp>

namespace jsondelta {

// Compute the delta between two values.
// Objects are compared key by key; anything else (including arrays) is
// compared as a whole and recorded as a single MODIFY if it differs.
// Applying the resulting delta to :before will yield :after.
value_delta
compute_value_delta(
    value const& before,
    value const& after,
    delta_config const& config = delta_config());

// Apply a delta to a value, returning the patched copy.
value
apply_value_delta(
    value const& original,
    value_delta const& delta,
    delta_config const& config = delta_config());

// Undo a delta, i.e., apply its inverse.
// revert_value_delta(after, compute_value_delta(before, after)) == before
value
revert_value_delta(
    value const& modified,
    value_delta const& delta,
    delta_config const& config = delta_config());

JSONDELTA_DEFINE_ERROR_INFO(string, delta_path)
JSONDELTA_DEFINE_ERROR_INFO(change_op, change_op)

// Thrown when a delta path can't be resolved in the value being patched,
// either because a value along the way isn't an object or because (in strict
// mode) an object along the way is missing.
JSONDELTA_DEFINE_EXCEPTION(invalid_delta_path)
JSONDELTA_DEFINE_ERROR_INFO(string, path_segment)

// Thrown in strict mode when a change contradicts the value it's being
// applied to. Expected and actual values are given as JSON text, or as
// "(absent)" for a missing key.
JSONDELTA_DEFINE_EXCEPTION(inconsistent_change)
JSONDELTA_DEFINE_ERROR_INFO(string, expected_value)
JSONDELTA_DEFINE_ERROR_INFO(string, actual_value)

// Thrown when a change lacks the side that its operation needs (e.g., an ADD
// with no :after value).
JSONDELTA_DEFINE_EXCEPTION(incomplete_change)

// Thrown when a path is deeper than the configured max_depth.
JSONDELTA_DEFINE_EXCEPTION(nesting_too_deep)
JSONDELTA_DEFINE_ERROR_INFO(std::size_t, depth_limit)

} // namespace jsondelta

#endif
