#pragma once

#include "export.hpp"

#include <compare>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>

namespace scopedi {

/// Identifies a requested capability: the interface type plus an optional
/// qualifier.  An empty qualifier denotes the unqualified binding.
struct binding_key {
    std::type_index type = std::type_index(typeid(void));
    std::string     qualifier;

    binding_key() = default;
    explicit binding_key(std::type_index t, std::string q = {})
        : type(t), qualifier(std::move(q)) {}

    bool operator==(const binding_key&) const = default;
    std::strong_ordering operator<=>(const binding_key&) const = default;
};

/// Build the key of interface `T`, optionally qualified.
template <typename T>
binding_key key_of(std::string_view qualifier = {}) {
    return binding_key(std::type_index(typeid(T)), std::string(qualifier));
}

/// Human-readable form: `Type` or `Type["qualifier"]`.
SCOPEDI_EXPORT std::string to_string(const binding_key& key);

} // namespace scopedi
