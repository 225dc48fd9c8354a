#pragma once

// Immutable per-scope binding table.  Internal header.

#include "scopedi/binding.hpp"
#include "scopedi/binding_key.hpp"

#include <cstddef>
#include <map>
#include <utility>
#include <vector>

namespace scopedi::internal {

class binding_table {
public:
    binding_table() = default;

    explicit binding_table(std::vector<binding> bindings)
        : bindings_(std::move(bindings))
    {
        for (std::size_t i = 0; i < bindings_.size(); ++i) {
            index_.emplace(bindings_[i].key, i);
        }
    }

    binding_table(const binding_table&) = delete;
    binding_table& operator=(const binding_table&) = delete;
    binding_table(binding_table&&) noexcept = default;
    binding_table& operator=(binding_table&&) noexcept = default;

    const binding* find(const binding_key& key) const noexcept {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &bindings_[it->second];
    }

    /// Bindings in registration order.
    const std::vector<binding>& bindings() const noexcept { return bindings_; }

    std::size_t size() const noexcept { return bindings_.size(); }

private:
    std::vector<binding> bindings_;
    std::map<binding_key, std::size_t> index_;
};

} // namespace scopedi::internal
