#include <jsondelta/encodings/json.hpp>

#include <jsondelta/utilities/testing.h>

using namespace jsondelta;

TEST_CASE("JSON parsing", "[encodings][json]")
{
    REQUIRE(parse_json_value("null") == value());
    REQUIRE(parse_json_value("true") == value(true));
    REQUIRE(parse_json_value("-1") == value(-1));
    REQUIRE(parse_json_value("1.25") == value(1.25));
    REQUIRE(parse_json_value(R"("hi")") == value("hi"));
    REQUIRE(parse_json_value("[1, 2]") == value::array({1, 2}));
    REQUIRE(
        parse_json_value(R"({"b": [], "a": {"c": false}})")
        == value{{"a", {{"c", false}}}, {"b", value::array()}});
}

TEST_CASE("malformed JSON", "[encodings][json]")
{
    string text = R"({"a": )";
    try
    {
        parse_json_value(text);
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<parsed_text_info>(e) == text);
        REQUIRE(get_required_error_info<expected_format_info>(e) == "JSON");
        get_required_error_info<internal_error_message_info>(e);
    }
}

TEST_CASE("JSON writing", "[encodings][json]")
{
    REQUIRE(value_to_json(value()) == "null");
    REQUIRE(
        value_to_json(value{{"b", 1}, {"a", {1, "x"}}})
        == R"({"a":[1,"x"],"b":1})");
}
