#ifndef JSONDELTA_ENCODINGS_JSON_HPP
#define JSONDELTA_ENCODINGS_JSON_HPP

#include <jsondelta/core/type_definitions.h>
#include <jsondelta/utilities/text.h>

// JSON - conversion to and from JSON strings

namespace jsondelta {

// Parse some JSON text into a value.
// Malformed text is reported as a parsing_error carrying the text and the
// parser's own message.
value
parse_json_value(char const* json, size_t length);

// Same as above, but accepts a string.
static inline value
parse_json_value(string const& json)
{
    return parse_json_value(json.c_str(), json.length());
}

// Write a value to a string in compact JSON format.
string
value_to_json(value const& v);

} // namespace jsondelta

#endif
