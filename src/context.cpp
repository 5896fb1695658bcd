#include "wheatgrass/context.hpp"

#include <algorithm>
#include <iterator>

namespace wheatgrass {

// ---------------------------------------------------------------
// binding_table
// ---------------------------------------------------------------

binding_table::binding_table(std::vector<binding> frozen)
    : bindings(std::move(frozen))
{
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        const auto& k = bindings[i].bound_key;
        by_key.insert_or_assign(k, i);
        by_type[{k.type(), k.generic()}].push_back(i);
    }
}

binding_table::match_result binding_table::match(const key& requested,
                                                 std::optional<std::size_t> exclude) const {
    auto exact = by_key.find(requested);
    if (exact != by_key.end() && exact->second != exclude) {
        return {exact->second, 1};
    }
    if (requested.is_named()) return {};

    auto it = by_type.find({requested.type(), requested.generic()});
    if (it == by_type.end()) return {};

    match_result result;
    for (auto idx : it->second) {
        if (idx == exclude) continue;
        if (!bindings[idx].bound_key.has_qualifiers_of(requested)) continue;
        ++result.candidates;
        result.index = idx;
    }
    if (result.candidates != 1) result.index.reset();
    return result;
}

// ---------------------------------------------------------------
// context
// ---------------------------------------------------------------

context::context()
    : table_(std::make_shared<const binding_table>(std::vector<binding>{}))
{}

context::context(std::shared_ptr<const binding_table> table)
    : table_(std::move(table))
{}

context::~context() = default;

std::size_t context::size() const noexcept {
    return table_->bindings.size();
}

bool context::contains(const key& k) const {
    return table_->match(k).index.has_value();
}

const binding* context::find(const key& k) const {
    auto it = table_->by_key.find(k);
    if (it == table_->by_key.end()) return nullptr;
    return &table_->bindings[it->second];
}

const std::vector<binding>& context::bindings() const noexcept {
    return table_->bindings;
}

std::vector<key> context::keys() const {
    std::vector<key> result;
    result.reserve(table_->bindings.size());
    std::transform(table_->bindings.begin(), table_->bindings.end(),
                   std::back_inserter(result),
                   [](const binding& b) { return b.bound_key; });
    return result;
}

} // namespace wheatgrass
