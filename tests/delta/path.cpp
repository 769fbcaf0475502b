#include <jsondelta/delta/path.hpp>

#include <jsondelta/utilities/testing.h>

using namespace jsondelta;

static void
test_path_formatting(value_path const& path, string const& text)
{
    CAPTURE(text);
    REQUIRE(format_value_path(path) == text);
    REQUIRE(parse_value_path(text) == path);
}

TEST_CASE("simple paths", "[delta][path]")
{
    test_path_formatting({}, "");
    test_path_formatting({"user"}, "user");
    test_path_formatting({"user", "age"}, "user.age");
    test_path_formatting({"a", "b", "c", "d"}, "a.b.c.d");
    test_path_formatting({"key with spaces", "0"}, "key with spaces.0");
}

TEST_CASE("escaped paths", "[delta][path]")
{
    test_path_formatting({"key.with.dots"}, R"(key\.with\.dots)");
    test_path_formatting({"a.b", "c"}, R"(a\.b.c)");
    test_path_formatting({"back\\slash"}, R"(back\\slash)");
    test_path_formatting({"\\."}, R"(\\\.)");
    test_path_formatting({"a", "", "b"}, "a..b");
    test_path_formatting({"a", ""}, "a.");
    test_path_formatting({"", ""}, ".");
}

TEST_CASE("path extension", "[delta][path]")
{
    value_path root;
    auto user = extend_path(root, "user");
    REQUIRE(root.empty());
    REQUIRE(user == value_path{"user"});
    REQUIRE(extend_path(user, "age") == value_path{"user", "age"});
}

TEST_CASE("malformed paths", "[delta][path]")
{
    for (string text : {R"(a\)", R"(a\b)", R"(\x.y)"})
    {
        CAPTURE(text);
        try
        {
            parse_value_path(text);
            FAIL("no exception thrown");
        }
        catch (parsing_error& e)
        {
            REQUIRE(get_required_error_info<parsed_text_info>(e) == text);
        }
    }
}
