#ifndef JSONDELTA_CONFIG_HPP
#define JSONDELTA_CONFIG_HPP

#include <ostream>

#include <jsondelta/core/exception.hpp>

namespace jsondelta {

// application_mode controls how apply/revert react to a change that
// contradicts the value it's being applied to (e.g., removing a key that
// isn't there).
enum class application_mode
{
    // reject the delta with an inconsistent_change exception
    STRICT,
    // overwrite or skip, logging a warning
    PERMISSIVE
};

std::ostream&
operator<<(std::ostream& s, application_mode mode);

// Parse an application mode from its lowercase name ("strict" or
// "permissive").
application_mode
parse_application_mode(string const& name);

struct delta_config
{
    // how contradictions are handled when applying or reverting
    // (defaults to STRICT)
    application_mode mode = application_mode::STRICT;
    // the deepest object nesting that diff will walk and apply/revert will
    // resolve (unlimited if omitted)
    optional<std::size_t> max_depth;
    // the level of the "jsondelta" logger, as an spdlog level name
    // This only takes effect through initialize_logging(). The delta
    // operations ignore it.
    optional<string> log_level;
};

bool
operator==(delta_config const& a, delta_config const& b);
bool
operator!=(delta_config const& a, delta_config const& b);

// Read a config from a JSON object. All fields are optional.
delta_config
parse_delta_config(value const& json);

// If a config field is missing or malformed, this is thrown.
JSONDELTA_DEFINE_EXCEPTION(invalid_config)
JSONDELTA_DEFINE_ERROR_INFO(string, config_key)
JSONDELTA_DEFINE_ERROR_INFO(string, config_value)

} // namespace jsondelta

#endif
