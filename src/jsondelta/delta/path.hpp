#ifndef JSONDELTA_DELTA_PATH_HPP
#define JSONDELTA_DELTA_PATH_HPP

#include <jsondelta/core/type_definitions.h>
#include <jsondelta/utilities/text.h>

namespace jsondelta {

// value_path represents the path from the root of a value to a location
// within it, as the sequence of object keys that must be followed.
// The empty path refers to the root itself.
typedef std::vector<string> value_path;

// Extend a path by one key.
value_path
extend_path(value_path const& path, string const& key);

// Deltas address locations with dotted path strings (e.g., "user.age").
// Within a key, a literal '.' is written as "\." and a literal '\' as "\\",
// so keys without either character appear verbatim.
// The empty string is the root.
string
format_value_path(value_path const& path);

// Parse a dotted path string.
// A '\' that isn't followed by '.' or '\' is a parsing_error.
value_path
parse_value_path(string const& text);

} // namespace jsondelta

#endif
