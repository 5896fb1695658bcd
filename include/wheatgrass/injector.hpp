#pragma once

#include "export.hpp"
#include "context.hpp"
#include "exceptions.hpp"
#include "key.hpp"
#include "provider.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <typeindex>

namespace wheatgrass {

/// A context that resolves keys into values.  Immutable after build();
/// safe to share across threads for resolution.
class WHEATGRASS_EXPORT injector : public context,
                                   public std::enable_shared_from_this<injector> {
public:
    ~injector() override;

    injector(const injector&) = delete;
    injector& operator=(const injector&) = delete;

    // ---------------------------------------------------------------
    // Typed resolution
    // ---------------------------------------------------------------

    /// Resolve the unnamed key of T.  Throws unresolved_binding if absent.
    template <typename T>
    std::shared_ptr<T> get() {
        return get<T>(key::of<T>());
    }

    template <typename T>
    std::shared_ptr<T> get(std::string_view name) {
        return get<T>(key::named<T>(name));
    }

    /// Resolve `k`, whose declared type must be T.  For `T = provider<X>`
    /// a binding on the provider type itself wins; otherwise the binding
    /// on X is handed out as a provider.
    template <typename T>
    std::shared_ptr<T> get(const key& k) {
        check_type(k, typeid(T));
        if constexpr (is_provider_v<T>) {
            if (contains(k)) return std::static_pointer_cast<T>(resolve(k));
            auto inner = k.unwrapped();
            if (!inner.has_value()) throw unresolved_binding(k);
            return get_provider<typename T::value_type>(*inner);
        } else {
            return std::static_pointer_cast<T>(resolve(k));
        }
    }

    /// Like get(), but returns nullptr when nothing is bound to the key.
    /// Failures while producing a bound value still throw.
    template <typename T>
    std::shared_ptr<T> try_get() {
        return try_get<T>(key::of<T>());
    }

    template <typename T>
    std::shared_ptr<T> try_get(std::string_view name) {
        return try_get<T>(key::named<T>(name));
    }

    template <typename T>
    std::shared_ptr<T> try_get(const key& k) {
        if (!contains(k)) {
            auto inner = k.unwrapped();
            if (!inner.has_value() || !contains(*inner)) return nullptr;
        }
        return get<T>(k);
    }

    // ---------------------------------------------------------------
    // Providers
    // ---------------------------------------------------------------

    template <typename T>
    std::shared_ptr<provider<T>> get_provider() {
        return get_provider<T>(key::of<T>());
    }

    template <typename T>
    std::shared_ptr<provider<T>> get_provider(std::string_view name) {
        return get_provider<T>(key::named<T>(name));
    }

    /// A provider for the key `k` of T.  A PROVIDER binding hands out its
    /// provider object unevaluated; any other binding gets a provider that
    /// resolves `k` on each get().  Throws unresolved_binding if absent.
    template <typename T>
    std::shared_ptr<provider<T>> get_provider(const key& k) {
        check_type(k, typeid(T));
        if (auto bound = provider_object(k)) {
            return std::static_pointer_cast<provider<T>>(bound);
        }
        std::weak_ptr<injector> self = weak_from_this();
        return make_provider<T>([self, k]() -> std::shared_ptr<T> {
            auto inj = self.lock();
            if (!inj) {
                throw wheatgrass_error("provider for " + k.to_string()
                                       + " used after its injector was destroyed");
            }
            return inj->get<T>(k);
        });
    }

    // ---------------------------------------------------------------
    // Untyped core
    // ---------------------------------------------------------------

    /// Resolve `k` to its value.  VALUE bindings return the same instance
    /// on every call; PROVIDER bindings invoke the provider each time.
    std::shared_ptr<void> resolve(const key& k);

    /// The provider object behind a PROVIDER binding, nullptr for any
    /// other binding.  Throws unresolved_binding if nothing matches `k`.
    std::shared_ptr<void> provider_object(const key& k);

private:
    friend class root_injector_builder;

    struct impl;

    static std::shared_ptr<injector> create(std::shared_ptr<const binding_table> table);

    explicit injector(std::shared_ptr<const binding_table> table);

    void check_type(const key& k, std::type_index requested) const;

    std::size_t require_index(const key& k) const;
    std::shared_ptr<void> resolve_index(std::size_t idx);
    std::shared_ptr<void> produce_value(std::size_t idx);
    std::shared_ptr<void> provider_at(std::size_t idx);
    std::shared_ptr<void> resolve_transform(std::size_t idx);

    /// Build a diagnostic hint when `k` matches nothing.
    std::string unresolved_hint(const key& k) const;

    std::unique_ptr<impl> impl_;
};

} // namespace wheatgrass
