#pragma once

#include <string>

namespace scopedi {

/// What a registry does when a key it already holds is registered again.
enum class registration_policy {
    single,     // throw conflict_error
    replace,    // last registration wins
    skip        // first registration wins
};

struct build_options {
    /// Build the plan of every binding while sealing a scope (root at
    /// build(), children at open_scope()), so unbound keys and cycles are
    /// reported before anything is constructed.
    bool validate_on_build = true;

    /// Reject singletons that depend on scoped or transient bindings.
    bool validate_lifetimes = false;

    /// Construct every root singleton during build().
    bool eager_singletons = false;

    std::string root_scope_name = "root";
};

} // namespace scopedi
