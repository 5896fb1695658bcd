#pragma once

#include "export.hpp"
#include "binding.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <typeindex>
#include <utility>
#include <vector>

namespace wheatgrass {

// ---------------------------------------------------------------
// binding_table: frozen bindings plus lookup indices
// ---------------------------------------------------------------

struct WHEATGRASS_EXPORT binding_table {
    struct match_result {
        std::optional<std::size_t> index;
        std::size_t candidates = 0;  // > 1 when an unnamed lookup is ambiguous
    };

    std::vector<binding> bindings;

    // Index: key → binding index (keys are unique once frozen)
    std::map<key, std::size_t> by_key;

    // Index: (type, generic) → binding indices, for unnamed lookups
    std::map<std::pair<std::type_index, std::type_index>, std::vector<std::size_t>> by_type;

    explicit binding_table(std::vector<binding> frozen);

    /// Exact key match first.  Failing that, an unnamed key matches the one
    /// binding with the same type and generic witness whose qualifiers
    /// include the requested ones.  `exclude` keeps a binding from matching
    /// its own dependencies.
    match_result match(const key& requested,
                       std::optional<std::size_t> exclude = std::nullopt) const;
};

// ---------------------------------------------------------------
// context: immutable key → binding mapping
// ---------------------------------------------------------------

class WHEATGRASS_EXPORT context {
public:
    /// An empty context.
    context();
    virtual ~context();

    context(const context&) = default;
    context& operator=(const context&) = default;

    std::size_t size() const noexcept;
    bool empty() const noexcept { return size() == 0; }

    /// True when `k` would resolve to a binding (exact or unnamed match).
    bool contains(const key& k) const;

    /// Exact-key lookup; nullptr when absent.
    const binding* find(const key& k) const;

    /// All bindings in registration order.
    const std::vector<binding>& bindings() const noexcept;

    std::vector<key> keys() const;

protected:
    explicit context(std::shared_ptr<const binding_table> table);

    const binding_table& table() const noexcept { return *table_; }

private:
    friend class root_injector_builder;

    std::shared_ptr<const binding_table> table_;
};

} // namespace wheatgrass
