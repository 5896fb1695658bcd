#include "wheatgrass/injector.hpp"
#include "wheatgrass/exceptions.hpp"
#include "diagnostics.hpp"


#include <algorithm>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wheatgrass {

namespace {

// ---------------------------------------------------------------
// Per-thread resolution stack, for cycle detection
// ---------------------------------------------------------------

struct frame {
    const injector* owner;
    std::size_t index;
};

thread_local std::vector<frame> resolution_stack;

class resolution_guard {
public:
    resolution_guard(const injector* owner, std::size_t idx,
                     const std::vector<binding>& bindings) {
        auto first = std::find_if(resolution_stack.begin(), resolution_stack.end(),
            [&](const frame& f) { return f.owner == owner && f.index == idx; });
        if (first != resolution_stack.end()) {
            std::vector<key> cycle;
            for (auto it = first; it != resolution_stack.end(); ++it) {
                if (it->owner == owner) cycle.push_back(bindings[it->index].bound_key);
            }
            cycle.push_back(bindings[idx].bound_key);
            throw cyclic_binding(cycle);
        }
        resolution_stack.push_back({owner, idx});
    }

    ~resolution_guard() { resolution_stack.pop_back(); }

    resolution_guard(const resolution_guard&) = delete;
    resolution_guard& operator=(const resolution_guard&) = delete;
};

/// Run `fn` for binding `desc`, annotating library errors with the key being
/// resolved and wrapping anything else in resolution_error.
template <typename F>
std::shared_ptr<void> annotated(const binding& desc, F&& fn) {
    try {
        return fn();
    } catch (wheatgrass_error& e) {
        // Caught by non-const reference so the exception can be enriched
        // before it is rethrown.
        e.append_resolution_context(desc.bound_key);
        if (e.diagnostic_detail().empty()) {
            auto trace = internal::format_registration_trace(desc);
            if (!trace.empty()) e.set_diagnostic_detail(trace);
        }
        throw;
    } catch (const std::exception& e) {
        auto ex = resolution_error(desc.bound_key, e, desc.registration_location);
        ex.set_diagnostic_detail(internal::format_registration_trace(desc));
        throw ex;
    }
}

} // namespace

// ---------------------------------------------------------------
// Impl: per-injector instance cache
// ---------------------------------------------------------------

struct injector::impl {
    // Cache: binding index → produced value (lazy VALUE, transform result,
    // or provider object of a provides-method)
    std::recursive_mutex cache_mutex;
    std::unordered_map<std::size_t, std::shared_ptr<void>> cache;
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

injector::injector(std::shared_ptr<const binding_table> table)
    : context(std::move(table))
    , impl_(std::make_unique<impl>())
{}

injector::~injector() = default;

std::shared_ptr<injector> injector::create(std::shared_ptr<const binding_table> table) {
    return std::shared_ptr<injector>(new injector(std::move(table)));
}

// ---------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------

void injector::check_type(const key& k, std::type_index requested) const {
    if (k.type() != requested) {
        throw wheatgrass_error("key " + k.to_string() + " requested as "
                               + internal::demangle(requested));
    }
}

std::size_t injector::require_index(const key& k) const {
    auto m = table().match(k);
    if (!m.index) throw unresolved_binding(k, unresolved_hint(k));
    return *m.index;
}

// ---------------------------------------------------------------
// Untyped core
// ---------------------------------------------------------------

std::shared_ptr<void> injector::resolve(const key& k) {
    auto m = table().match(k);
    if (m.index) return resolve_index(*m.index);

    if (auto inner = k.unwrapped()) {
        if (auto bound = provider_object(*inner)) return bound;
        throw unresolved_binding(k, "the wrapped type is bound as a value; "
                                    "request it via get_provider<T>()");
    }
    throw unresolved_binding(k, unresolved_hint(k));
}

std::shared_ptr<void> injector::provider_object(const key& k) {
    auto idx = require_index(k);
    const auto& desc = table().bindings[idx];
    if (desc.kind != binding_kind::provider || desc.is_transform()) return nullptr;

    return annotated(desc, [&] {
        resolution_guard guard(this, idx, table().bindings);
        return provider_at(idx);
    });
}

std::shared_ptr<void> injector::resolve_index(std::size_t idx) {
    const auto& desc = table().bindings[idx];

    return annotated(desc, [&]() -> std::shared_ptr<void> {
        resolution_guard guard(this, idx, table().bindings);

        if (desc.is_transform()) return resolve_transform(idx);
        if (desc.kind == binding_kind::value) return produce_value(idx);

        auto value = desc.invoke(provider_at(idx));
        if (!value) {
            throw wheatgrass_error("provider for " + desc.bound_key.to_string()
                                   + " returned null");
        }
        return value;
    });
}

std::shared_ptr<void> injector::produce_value(std::size_t idx) {
    const auto& desc = table().bindings[idx];
    if (desc.instance) return desc.instance;

    std::lock_guard lock(impl_->cache_mutex);
    auto it = impl_->cache.find(idx);
    if (it != impl_->cache.end()) return it->second;

    WHEATGRASS_LOG(trace) << "producing " << desc.bound_key.to_string();
    auto value = desc.factory(*this);
    if (!value) {
        throw wheatgrass_error("factory for " + desc.bound_key.to_string()
                               + " returned null");
    }
    impl_->cache.emplace(idx, value);
    return value;
}

std::shared_ptr<void> injector::provider_at(std::size_t idx) {
    const auto& desc = table().bindings[idx];
    if (desc.instance) return desc.instance;

    std::lock_guard lock(impl_->cache_mutex);
    auto it = impl_->cache.find(idx);
    if (it != impl_->cache.end()) return it->second;

    auto bound = desc.factory(*this);
    if (!bound) {
        throw wheatgrass_error("provides-method for " + desc.bound_key.to_string()
                               + " returned a null provider");
    }
    impl_->cache.emplace(idx, bound);
    return bound;
}

std::shared_ptr<void> injector::resolve_transform(std::size_t idx) {
    const auto& desc = table().bindings[idx];
    auto source = table().match(*desc.rebinds, idx);
    if (!source.index) {
        throw unresolved_binding(*desc.rebinds,
                                 "rebound by " + desc.bound_key.to_string());
    }

    auto apply = [&] {
        auto value = desc.transform(*this, resolve_index(*source.index));
        if (!value) {
            throw wheatgrass_error("transform for " + desc.bound_key.to_string()
                                   + " returned null");
        }
        return value;
    };

    // Rebinding a provider: post-process every fresh value.
    if (desc.kind == binding_kind::provider) return apply();

    std::lock_guard lock(impl_->cache_mutex);
    auto it = impl_->cache.find(idx);
    if (it != impl_->cache.end()) return it->second;

    auto value = apply();
    impl_->cache.emplace(idx, value);
    return value;
}

// ---------------------------------------------------------------
// Diagnostic: hint for better unresolved_binding messages
// ---------------------------------------------------------------

std::string injector::unresolved_hint(const key& k) const {
    auto m = table().match(k);
    if (m.candidates > 1) {
        return std::to_string(m.candidates)
               + " bindings match by type; request a named or qualified key";
    }

    std::string near;
    for (const auto& desc : table().bindings) {
        if (desc.bound_key.type() != k.type()) continue;
        if (!near.empty()) near += ", ";
        near += desc.bound_key.to_string();
    }
    if (near.empty()) return {};
    return "bindings of this type exist under: " + near;
}

} // namespace wheatgrass
