#include <jsondelta/delta/change.hpp>

#include <jsondelta/encodings/json.hpp>

namespace jsondelta {

std::ostream&
operator<<(std::ostream& s, change_op op)
{
    switch (op)
    {
        case change_op::ADD:
            s << "add";
            break;
        case change_op::REMOVE:
            s << "remove";
            break;
        case change_op::MODIFY:
            s << "modify";
            break;
    }
    return s;
}

bool
operator==(value_change const& a, value_change const& b)
{
    return a.op == b.op && a.before == b.before && a.after == b.after;
}
bool
operator!=(value_change const& a, value_change const& b)
{
    return !(a == b);
}

std::ostream&
operator<<(std::ostream& s, value_change const& change)
{
    s << change.op;
    if (change.before)
        s << " " << value_to_json(*change.before);
    if (change.before && change.after)
        s << " ->";
    if (change.after)
        s << " " << value_to_json(*change.after);
    return s;
}

value_change
make_add_change(value after)
{
    value_change change;
    change.op = change_op::ADD;
    change.after = std::move(after);
    return change;
}

value_change
make_remove_change(value before)
{
    value_change change;
    change.op = change_op::REMOVE;
    change.before = std::move(before);
    return change;
}

value_change
make_modify_change(value before, value after)
{
    value_change change;
    change.op = change_op::MODIFY;
    change.before = std::move(before);
    change.after = std::move(after);
    return change;
}

value_change
invert_value_change(value_change const& change)
{
    value_change inverse;
    switch (change.op)
    {
        case change_op::ADD:
            inverse.op = change_op::REMOVE;
            break;
        case change_op::REMOVE:
            inverse.op = change_op::ADD;
            break;
        case change_op::MODIFY:
            inverse.op = change_op::MODIFY;
            break;
    }
    inverse.before = change.after;
    inverse.after = change.before;
    return inverse;
}

std::ostream&
operator<<(std::ostream& s, value_delta const& delta)
{
    s << "{";
    bool first = true;
    for (auto const& [path, change] : delta)
    {
        if (!first)
            s << ",";
        first = false;
        s << " \"" << path << "\": " << change;
    }
    s << " }";
    return s;
}

value_delta
invert_value_delta(value_delta const& delta)
{
    value_delta inverse;
    for (auto const& [path, change] : delta)
        inverse.emplace_hint(inverse.end(), path, invert_value_change(change));
    return inverse;
}

} // namespace jsondelta
