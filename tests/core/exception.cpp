#include <jsondelta/core/exception.hpp>

#include <jsondelta/utilities/testing.h>
#include <jsondelta/utilities/text.h>

using namespace jsondelta;

TEST_CASE("error info", "[core][exception]")
{
    parsing_error error;
    error << parsed_text_info("asdf");

    REQUIRE(get_required_error_info<parsed_text_info>(error) == "asdf");

    try
    {
        get_required_error_info<expected_format_info>(error);
        FAIL("no exception thrown");
    }
    catch (missing_error_info& e)
    {
        get_required_error_info<error_info_id_info>(e);
        get_required_error_info<wrapped_exception_diagnostics_info>(e);
    }
}

TEST_CASE("thrown exceptions", "[core][exception]")
{
    try
    {
        JSONDELTA_THROW(parsing_error() << parsed_text_info("qwerty"));
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<parsed_text_info>(e) == "qwerty");
        REQUIRE(get_error_info<stacktrace_info>(e) != nullptr);
        REQUIRE(string(e.what()).find("qwerty") != string::npos);
    }
}
