#ifndef JSONDELTA_CORE_TYPE_DEFINITIONS_H
#define JSONDELTA_CORE_TYPE_DEFINITIONS_H

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace jsondelta {

using std::string;

using std::nullopt;
using std::optional;

// some(x) creates a std::optional of the proper type with the value of :x.
template<class T>
auto
some(T&& x)
{
    return std::optional<std::remove_cv_t<std::remove_reference_t<T>>>(
        std::forward<T>(x));
}

// value is the JSON document type that deltas are computed over.
// Objects are backed by std::map, so their keys iterate in sorted order.
typedef nlohmann::json value;

} // namespace jsondelta

#endif
