#ifndef JSONDELTA_DELTA_CHANGE_HPP
#define JSONDELTA_DELTA_CHANGE_HPP

#include <map>
#include <ostream>

#include <jsondelta/core/type_definitions.h>

namespace jsondelta {

enum class change_op
{
    // a key that's present in the new value but not the old one
    ADD,
    // a key that's present in the old value but not the new one
    REMOVE,
    // a location whose content differs between the two values
    MODIFY
};

std::ostream&
operator<<(std::ostream& s, change_op op);

// value_change describes the difference at a single location.
// :before is present for REMOVE and MODIFY, :after for ADD and MODIFY. Both
// sides are kept so that a change can be applied in either direction.
struct value_change
{
    change_op op;

    optional<value> before, after;
};

bool
operator==(value_change const& a, value_change const& b);
bool
operator!=(value_change const& a, value_change const& b);

std::ostream&
operator<<(std::ostream& s, value_change const& change);

value_change
make_add_change(value after);

value_change
make_remove_change(value before);

value_change
make_modify_change(value before, value after);

// Get the change that undoes :change.
// ADD and REMOVE swap, and MODIFY swaps its two sides.
value_change
invert_value_change(value_change const& change);

// value_delta maps dotted paths (see path.hpp) to the change at that path.
// std::map keeps the paths sorted, so a parent always comes before the paths
// below it.
typedef std::map<string, value_change> value_delta;

std::ostream&
operator<<(std::ostream& s, value_delta const& delta);

// Invert every change in a delta.
value_delta
invert_value_delta(value_delta const& delta);

} // namespace jsondelta

#endif
