#include "wheatgrass/root_injector_builder.hpp"
#include "wheatgrass/injector.hpp"

#include "diagnostics.hpp"

#include <functional>
#include <map>
#include <optional>
#include <vector>

namespace wheatgrass {

void validate_bindings(const binding_table& table, std::source_location loc);

namespace {

std::vector<binding> settle_collisions(std::vector<binding> pending,
                                       collision_policy policy) {
    std::vector<binding> result;
    std::map<key, std::size_t> position;
    result.reserve(pending.size());

    for (auto& b : pending) {
        auto it = position.find(b.bound_key);
        if (it == position.end()) {
            position.emplace(b.bound_key, result.size());
            result.push_back(std::move(b));
            continue;
        }

        auto& existing = result[it->second];
        switch (policy) {
            case collision_policy::last_wins:
                WHEATGRASS_LOG(debug) << b.api_name << " shadows " << existing.api_name
                                      << " for " << b.bound_key.to_string();
                existing = std::move(b);
                break;

            case collision_policy::first_wins:
                WHEATGRASS_LOG(debug) << b.api_name << " for " << b.bound_key.to_string()
                                      << " dropped; already bound by " << existing.api_name;
                break;

            case collision_policy::reject: {
                bool same_instance = existing.instance
                                  && existing.instance == b.instance
                                  && existing.kind == b.kind;
                if (!same_instance) {
                    throw duplicate_binding(b.bound_key, b.registration_location);
                }
                break;
            }
        }
    }
    return result;
}

/// A transform takes over the kind of the binding it rebinds.  Chains are
/// followed; a transform cycle is left for resolution to report.
void settle_transform_kinds(binding_table& table) {
    enum class visit_state { unvisited, in_progress, done };
    std::vector<visit_state> states(table.bindings.size(), visit_state::unvisited);

    std::function<binding_kind(std::size_t)> settle = [&](std::size_t idx) {
        auto& desc = table.bindings[idx];
        if (!desc.is_transform() || states[idx] == visit_state::done) return desc.kind;
        if (states[idx] == visit_state::in_progress) return binding_kind::value;

        states[idx] = visit_state::in_progress;
        auto source = table.match(*desc.rebinds, idx);
        if (source.index) desc.kind = settle(*source.index);
        states[idx] = visit_state::done;
        return desc.kind;
    };

    for (std::size_t i = 0; i < table.bindings.size(); ++i) {
        settle(i);
    }
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct root_injector_builder::Impl {
    std::vector<binding> pending;
    bool built = false;
};

// ---------------------------------------------------------------
// Constructors / Destructor / Move
// ---------------------------------------------------------------

root_injector_builder::root_injector_builder()
    : impl_(std::make_unique<Impl>())
{}

root_injector_builder::~root_injector_builder() = default;

root_injector_builder::root_injector_builder(root_injector_builder&&) noexcept = default;
root_injector_builder& root_injector_builder::operator=(root_injector_builder&&) noexcept = default;

root_injector_builder new_injector() {
    return root_injector_builder();
}

// ---------------------------------------------------------------
// Non-template registration core
// ---------------------------------------------------------------

void root_injector_builder::ensure_open(std::source_location loc) const {
    if (impl_->built) {
        throw configuration_error("cannot add bindings after build() has been called", loc);
    }
}

void root_injector_builder::add_binding(key k, std::shared_ptr<void> instance,
                                        std::string api_name, std::source_location loc) {
    ensure_open(loc);

    binding b;
    b.bound_key = std::move(k);
    b.kind = binding_kind::value;
    b.instance = std::move(instance);
    b.api_name = std::move(api_name);
    b.registration_location = loc;
    b.registration_stacktrace = internal::capture_stacktrace();
    impl_->pending.push_back(std::move(b));
}

void root_injector_builder::merge_context(const context& ctx) {
    ensure_open(std::source_location::current());
    for (const auto& b : ctx.bindings()) {
        impl_->pending.push_back(b);
    }
}

void root_injector_builder::merge_scanned(std::vector<binding> scanned) {
    for (auto& b : scanned) {
        impl_->pending.push_back(std::move(b));
    }
}

const std::vector<binding>& root_injector_builder::pending() const {
    return impl_->pending;
}

// ---------------------------------------------------------------
// build
// ---------------------------------------------------------------

std::shared_ptr<binding_table> root_injector_builder::freeze(const build_options& options,
                                                             std::source_location loc) {
    if (impl_->built) {
        throw configuration_error("build() can only be called once", loc);
    }
    // A failed build consumes the builder too.
    impl_->built = true;

    // ① Settle key collisions in registration order.
    auto frozen = settle_collisions(std::move(impl_->pending), options.collisions);

    // ② Index, then let transforms inherit the kind of what they rebind.
    auto table = std::make_shared<binding_table>(std::move(frozen));
    settle_transform_kinds(*table);

    // ③ Validate before handing out
    if (options.validate_on_build) {
        validate_bindings(*table, loc);
    }
    return table;
}

std::shared_ptr<injector> root_injector_builder::build(build_options options,
                                                       std::source_location loc) {
    auto table = freeze(options, loc);
    WHEATGRASS_LOG(debug) << "built injector with " << table->bindings.size() << " binding(s)";
    return injector::create(std::move(table));
}

context root_injector_builder::build_context(build_options options,
                                             std::source_location loc) {
    auto table = freeze(options, loc);
    WHEATGRASS_LOG(debug) << "built context with " << table->bindings.size() << " binding(s)";
    return context(std::move(table));
}

} // namespace wheatgrass
