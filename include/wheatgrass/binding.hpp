#pragma once

#include "export.hpp"
#include "key.hpp"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace wheatgrass {

class injector;

enum class binding_kind {
    value,
    provider
};

constexpr std::string_view to_string(binding_kind kind) noexcept {
    constexpr std::string_view names[] = {"value", "provider"};
    return names[static_cast<int>(kind)];
}

/// How build() settles two bindings with the same key.
enum class collision_policy {
    last_wins,   // the later registration shadows the earlier one
    first_wins,  // the later registration is dropped
    reject       // duplicate_binding, unless both carry the same instance
};

struct build_options {
    collision_policy collisions = collision_policy::last_wins;

    /// Check declared dependencies of provides-methods and transforms at
    /// build time: missing keys and static cycles.
    bool validate_on_build = false;
};

/// Produces a value (or a provider object) using the resolving injector.
using factory_fn = std::function<std::shared_ptr<void>(injector&)>;

/// Calls get() on a type-erased provider<X> object.
using provider_call_fn = std::function<std::shared_ptr<void>(const std::shared_ptr<void>&)>;

/// Post-processes the value of a rebound binding.
using transform_fn = std::function<std::shared_ptr<void>(injector&, std::shared_ptr<void>)>;

// ---------------------------------------------------------------
// dependency_info: one declared argument of a binding
// ---------------------------------------------------------------

struct dependency_info {
    key  target;
    bool deferred = false;  // injected as provider<X>; never resolved eagerly

    bool operator==(const dependency_info&) const = default;
};

// ---------------------------------------------------------------
// binding: one key → payload association
// ---------------------------------------------------------------

/// A VALUE binding carries either a ready `instance` or a `factory` whose
/// result the injector caches.  A PROVIDER binding carries the provider
/// object (ready `instance` or a `factory` run once) and `invoke`, which
/// calls get() on it.  A binding with `rebinds` set post-processes the
/// binding of that key through `transform` and takes over its kind.
struct binding {
    key             bound_key;
    binding_kind    kind = binding_kind::value;
    std::shared_ptr<void> instance;
    factory_fn      factory;
    provider_call_fn invoke;
    std::optional<key> rebinds;
    transform_fn    transform;
    std::vector<dependency_info> dependencies;

    // Diagnostics
    std::string          api_name;
    std::source_location registration_location;
    std::any             registration_stacktrace;

    bool is_transform() const noexcept { return rebinds.has_value(); }
};

namespace internal {
/// Capture the current call stack.  Empty unless built with
/// WHEATGRASS_HAS_STACKTRACE.
WHEATGRASS_EXPORT std::any capture_stacktrace();
} // namespace internal

} // namespace wheatgrass
