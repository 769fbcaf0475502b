#ifndef JSONDELTA_UTILITIES_TEXT_H
#define JSONDELTA_UTILITIES_TEXT_H

#include <jsondelta/core/exception.hpp>

namespace jsondelta {

// If a simple parsing operation fails, this exception can be thrown.
JSONDELTA_DEFINE_EXCEPTION(parsing_error)
JSONDELTA_DEFINE_ERROR_INFO(string, expected_format)
JSONDELTA_DEFINE_ERROR_INFO(string, parsed_text)

} // namespace jsondelta

#endif
