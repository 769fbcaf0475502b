#include <jsondelta/delta/path.hpp>

namespace jsondelta {

value_path
extend_path(value_path const& path, string const& key)
{
    value_path extended = path;
    extended.push_back(key);
    return extended;
}

string
format_value_path(value_path const& path)
{
    string text;
    bool first = true;
    for (auto const& key : path)
    {
        if (!first)
            text.push_back('.');
        first = false;
        for (char c : key)
        {
            if (c == '.' || c == '\\')
                text.push_back('\\');
            text.push_back(c);
        }
    }
    return text;
}

value_path
parse_value_path(string const& text)
{
    value_path path;
    if (text.empty())
        return path;

    string key;
    for (auto i = text.begin(); i != text.end(); ++i)
    {
        switch (*i)
        {
            case '.':
                path.push_back(std::move(key));
                key.clear();
                break;
            case '\\':
                ++i;
                if (i == text.end() || (*i != '.' && *i != '\\'))
                {
                    JSONDELTA_THROW(
                        parsing_error()
                        << expected_format_info("dotted key path")
                        << parsed_text_info(text));
                }
                key.push_back(*i);
                break;
            default:
                key.push_back(*i);
        }
    }
    path.push_back(std::move(key));
    return path;
}

} // namespace jsondelta
