// Closed catalog of members callable from query text: members of the
// predefined types, the Math/Convert holders and constructors.
#pragma once
#include "dynq/types.hpp"
#include "dynq/value.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dynq {

using builtin_impl = std::function<value(const value& instance, const std::vector<value>& args)>;

struct builtin {
    std::string name;
    type_ref owner{nullptr};   // nullptr: instance member available on every type (ToString)
    bool is_static{false};
    bool is_property{false};
    bool is_constructor{false};
    std::vector<type_ref> params;
    type_ref result{nullptr};
    builtin_impl impl;
};

// Members of `owner` named `name` (case-insensitive), restricted to static or
// instance members. Properties and methods are returned together.
std::vector<const builtin*> find_builtins(type_ref owner, std::string_view name, bool static_access);
std::vector<const builtin*> find_constructors(type_ref owner);
// Every member name of `owner`, used for "did you mean" hints.
std::vector<std::string> builtin_names(type_ref owner, bool static_access);

} // namespace dynq
