#include <jsondelta/encodings/json.hpp>

namespace jsondelta {

value
parse_json_value(char const* json, size_t length)
{
    try
    {
        return value::parse(json, json + length);
    }
    catch (nlohmann::json::parse_error& e)
    {
        JSONDELTA_THROW(
            parsing_error() << expected_format_info("JSON")
                            << parsed_text_info(string(json, length))
                            << internal_error_message_info(e.what()));
    }
}

string
value_to_json(value const& v)
{
    // Invalid UTF-8 in strings is replaced rather than thrown on, since this
    // is also used to describe values in error reports.
    return v.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace jsondelta
