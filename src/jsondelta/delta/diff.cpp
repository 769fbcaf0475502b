#include <jsondelta/delta/diff.hpp>

#include <cmath>

#include <boost/lexical_cast.hpp>

#include <jsondelta/encodings/json.hpp>
#include <jsondelta/utilities/logging.h>

namespace jsondelta {

// :depth is the number of keys needed to address the location being
// checked.
static void
check_depth(
    std::size_t depth, value_path const& path, delta_config const& config)
{
    if (config.max_depth && depth > *config.max_depth)
    {
        JSONDELTA_THROW(
            nesting_too_deep() << depth_limit_info(*config.max_depth)
                               << delta_path_info(format_value_path(path)));
    }
}

// Same as nlohmann's ==, except that NaN is equal to NaN, so that every
// value is equal to itself.
static bool
same_value(value const& a, value const& b)
{
    if (a.is_number_float() && b.is_number_float())
    {
        auto x = a.get<double>(), y = b.get<double>();
        return x == y || (std::isnan(x) && std::isnan(y));
    }
    if (a.is_object() && b.is_object())
    {
        auto const& a_fields = a.get_ref<value::object_t const&>();
        auto const& b_fields = b.get_ref<value::object_t const&>();
        if (a_fields.size() != b_fields.size())
            return false;
        for (auto a_i = a_fields.begin(), b_i = b_fields.begin();
             a_i != a_fields.end();
             ++a_i, ++b_i)
        {
            if (a_i->first != b_i->first
                || !same_value(a_i->second, b_i->second))
            {
                return false;
            }
        }
        return true;
    }
    if (a.is_array() && b.is_array())
    {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i != a.size(); ++i)
        {
            if (!same_value(a[i], b[i]))
                return false;
        }
        return true;
    }
    return a == b;
}

static void
compute_value_delta(
    value_delta& delta,
    value_path const& path,
    value const& a,
    value const& b,
    delta_config const& config);

// The empty key is the one key whose path can't be told apart from its
// parent's, and at the root that parent is the whole document.
static bool
root_empty_key_changed(value::object_t const& a, value::object_t const& b)
{
    auto a_field = a.find(string());
    auto b_field = b.find(string());
    if (a_field == a.end() || b_field == b.end())
        return (a_field == a.end()) != (b_field == b.end());
    return !same_value(a_field->second, b_field->second);
}

static void
compute_object_delta(
    value_delta& delta,
    value_path const& path,
    value::object_t const& a,
    value::object_t const& b,
    delta_config const& config)
{
    if (path.empty() && root_empty_key_changed(a, b))
    {
        delta.emplace(string(), make_modify_change(value(a), value(b)));
        return;
    }

    check_depth(path.size() + 1, path, config);

    // Both maps are sorted, so walk them in parallel.
    auto a_i = a.begin(), a_end = a.end();
    auto b_i = b.begin(), b_end = b.end();
    while (a_i != a_end || b_i != b_end)
    {
        if (b_i == b_end || (a_i != a_end && a_i->first < b_i->first))
        {
            delta.emplace(
                format_value_path(extend_path(path, a_i->first)),
                make_remove_change(a_i->second));
            ++a_i;
        }
        else if (a_i == a_end || b_i->first < a_i->first)
        {
            delta.emplace(
                format_value_path(extend_path(path, b_i->first)),
                make_add_change(b_i->second));
            ++b_i;
        }
        else
        {
            compute_value_delta(
                delta,
                extend_path(path, a_i->first),
                a_i->second,
                b_i->second,
                config);
            ++a_i;
            ++b_i;
        }
    }
}

static void
compute_value_delta(
    value_delta& delta,
    value_path const& path,
    value const& a,
    value const& b,
    delta_config const& config)
{
    if (same_value(a, b))
        return;

    // If a and b are both objects, do a key-by-key diff.
    if (a.is_object() && b.is_object())
    {
        compute_object_delta(
            delta,
            path,
            a.get_ref<value::object_t const&>(),
            b.get_ref<value::object_t const&>(),
            config);
    }
    // Otherwise, the whole value is replaced. This includes arrays and
    // changes of type.
    else
    {
        delta.emplace(format_value_path(path), make_modify_change(a, b));
    }
}

value_delta
compute_value_delta(
    value const& before, value const& after, delta_config const& config)
{
    value_delta delta;
    compute_value_delta(delta, value_path(), before, after, config);
    JSONDELTA_LOG_CALL(<< JSONDELTA_LOG_ARG(delta.size()))
    return delta;
}

namespace {

// everything needed to report on the change currently being applied
struct change_context
{
    string const& path;
    value_change const& change;
    delta_config const& config;
};

} // namespace

static string
describe_field(value const* field)
{
    return field ? value_to_json(*field) : string("(absent)");
}

// Report that the value found at a change's location isn't what the change
// expects. In strict mode, this throws. In permissive mode, it just warns and
// the caller carries on.
static void
report_contradiction(
    change_context const& context,
    string const& expected,
    value const* actual)
{
    if (context.config.mode == application_mode::STRICT)
    {
        get_logger()->debug(
            "rejecting {} at '{}': expected {}",
            boost::lexical_cast<string>(context.change.op),
            context.path,
            expected);
        JSONDELTA_THROW(
            inconsistent_change()
            << delta_path_info(context.path)
            << change_op_info(context.change.op)
            << expected_value_info(expected)
            << actual_value_info(describe_field(actual)));
    }
    get_logger()->warn(
        "tolerating {} at '{}': expected {}, found {}",
        boost::lexical_cast<string>(context.change.op),
        context.path,
        expected,
        describe_field(actual));
}

// Check that a change carries the sides that its operation needs.
static void
check_completeness(change_context const& context)
{
    auto const& change = context.change;
    bool needs_before = change.op != change_op::ADD;
    bool needs_after = change.op != change_op::REMOVE;
    if ((needs_before && !change.before) || (needs_after && !change.after))
    {
        JSONDELTA_THROW(
            incomplete_change() << delta_path_info(context.path)
                                << change_op_info(change.op));
    }
}

static void
check_before_side(change_context const& context, value const& actual)
{
    auto const& expected = *context.change.before;
    if (!same_value(actual, expected))
        report_contradiction(context, value_to_json(expected), &actual);
}

static void
apply_root_change(value& root, change_context const& context)
{
    auto const& change = context.change;
    switch (change.op)
    {
        // The root always exists, so it can only be modified.
        case change_op::ADD:
            report_contradiction(
                context, "(a location below the root)", &root);
            root = *change.after;
            break;
        case change_op::REMOVE:
            report_contradiction(
                context, "(a location below the root)", &root);
            root = value();
            break;
        case change_op::MODIFY:
            check_before_side(context, root);
            root = *change.after;
            break;
    }
}

// Find the object holding the last key in :path, creating missing objects
// along the way where the change allows it. Returns nullptr if the change
// should be skipped.
static value::object_t*
resolve_parent(
    value& root, value_path const& path, change_context const& context)
{
    bool create_missing
        = context.change.op == change_op::ADD
          || (context.change.op == change_op::MODIFY
              && context.config.mode == application_mode::PERMISSIVE);

    value* current = &root;
    for (std::size_t i = 0; i != path.size(); ++i)
    {
        if (!current->is_object())
        {
            JSONDELTA_THROW(
                invalid_delta_path()
                << delta_path_info(context.path)
                << path_segment_info(path[i]));
        }
        auto& object = current->get_ref<value::object_t&>();
        if (i + 1 == path.size())
            return &object;

        auto field = object.find(path[i]);
        if (field == object.end())
        {
            if (create_missing)
            {
                field = object.emplace(path[i], value::object()).first;
            }
            else if (context.config.mode == application_mode::PERMISSIVE)
            {
                get_logger()->warn(
                    "skipping {} at '{}': '{}' is absent",
                    boost::lexical_cast<string>(context.change.op),
                    context.path,
                    path[i]);
                return nullptr;
            }
            else
            {
                JSONDELTA_THROW(
                    invalid_delta_path()
                    << delta_path_info(context.path)
                    << path_segment_info(path[i]));
            }
        }
        current = &field->second;
    }
    return nullptr;
}

static void
apply_value_change(
    value& root,
    string const& path_text,
    value_change const& change,
    delta_config const& config)
{
    change_context context{path_text, change, config};
    check_completeness(context);

    value_path path;
    try
    {
        path = parse_value_path(path_text);
    }
    catch (boost::exception& e)
    {
        e << delta_path_info(path_text);
        throw;
    }
    check_depth(path.size(), path, config);

    if (path.empty())
    {
        apply_root_change(root, context);
        return;
    }

    auto* parent = resolve_parent(root, path, context);
    if (!parent)
        return;

    auto const& key = path.back();
    auto field = parent->find(key);
    switch (change.op)
    {
        case change_op::ADD:
            if (field != parent->end())
                report_contradiction(context, "(absent)", &field->second);
            (*parent)[key] = *change.after;
            break;
        case change_op::REMOVE:
            if (field == parent->end())
            {
                report_contradiction(
                    context, value_to_json(*change.before), nullptr);
                break;
            }
            check_before_side(context, field->second);
            parent->erase(field);
            break;
        case change_op::MODIFY:
            if (field != parent->end())
                check_before_side(context, field->second);
            else
            {
                report_contradiction(
                    context, value_to_json(*change.before), nullptr);
            }
            (*parent)[key] = *change.after;
            break;
    }
}

value
apply_value_delta(
    value const& original,
    value_delta const& delta,
    delta_config const& config)
{
    JSONDELTA_LOG_CALL(
        << JSONDELTA_LOG_ARG(delta.size()) << JSONDELTA_LOG_ARG(config.mode))
    value patched = original;
    for (auto const& [path, change] : delta)
        apply_value_change(patched, path, change, config);
    return patched;
}

value
revert_value_delta(
    value const& modified,
    value_delta const& delta,
    delta_config const& config)
{
    JSONDELTA_LOG_CALL(
        << JSONDELTA_LOG_ARG(delta.size()) << JSONDELTA_LOG_ARG(config.mode))
    return apply_value_delta(modified, invert_value_delta(delta), config);
}

} // namespace jsondelta
