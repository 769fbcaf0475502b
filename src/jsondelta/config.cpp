#include <jsondelta/config.hpp>

#include <cstdint>

#include <spdlog/common.h>

#include <jsondelta/encodings/json.hpp>

namespace jsondelta {

std::ostream&
operator<<(std::ostream& s, application_mode mode)
{
    switch (mode)
    {
        case application_mode::STRICT:
            s << "strict";
            break;
        case application_mode::PERMISSIVE:
            s << "permissive";
            break;
    }
    return s;
}

application_mode
parse_application_mode(string const& name)
{
    if (name == "strict")
        return application_mode::STRICT;
    if (name == "permissive")
        return application_mode::PERMISSIVE;
    JSONDELTA_THROW(
        parsing_error() << expected_format_info("strict|permissive")
                        << parsed_text_info(name));
}

bool
operator==(delta_config const& a, delta_config const& b)
{
    return a.mode == b.mode && a.max_depth == b.max_depth
           && a.log_level == b.log_level;
}
bool
operator!=(delta_config const& a, delta_config const& b)
{
    return !(a == b);
}

static application_mode
parse_mode_field(string const& key, string const& text)
{
    try
    {
        return parse_application_mode(text);
    }
    catch (parsing_error&)
    {
        JSONDELTA_THROW(
            invalid_config() << config_key_info(key)
                             << config_value_info(text));
    }
}

static string
parse_log_level_field(string const& key, string const& text)
{
    // spdlog maps unrecognized names to 'off', so that has to be checked for
    // explicitly.
    if (spdlog::level::from_str(text) == spdlog::level::off && text != "off")
    {
        JSONDELTA_THROW(
            invalid_config() << config_key_info(key)
                             << config_value_info(text));
    }
    return text;
}

static string
require_string_field(string const& key, value const& field)
{
    if (!field.is_string())
    {
        JSONDELTA_THROW(
            invalid_config() << config_key_info(key)
                             << config_value_info(value_to_json(field)));
    }
    return field.get<string>();
}

delta_config
parse_delta_config(value const& json)
{
    if (!json.is_object())
    {
        JSONDELTA_THROW(
            invalid_config() << config_value_info(value_to_json(json)));
    }
    delta_config config;
    for (auto const& [key, field] : json.items())
    {
        if (key == "application_mode")
        {
            config.mode
                = parse_mode_field(key, require_string_field(key, field));
        }
        else if (key == "max_depth")
        {
            bool is_non_negative_integer
                = field.is_number_unsigned()
                  || (field.is_number_integer()
                      && field.get<std::int64_t>() >= 0);
            if (!is_non_negative_integer)
            {
                JSONDELTA_THROW(
                    invalid_config()
                    << config_key_info(key)
                    << config_value_info(value_to_json(field)));
            }
            config.max_depth = field.get<std::size_t>();
        }
        else if (key == "log_level")
        {
            config.log_level
                = parse_log_level_field(key, require_string_field(key, field));
        }
        else
        {
            JSONDELTA_THROW(
                invalid_config() << config_key_info(key)
                                 << config_value_info(value_to_json(field)));
        }
    }
    return config;
}

} // namespace jsondelta
