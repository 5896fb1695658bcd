#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "context.hpp"
#include "exceptions.hpp"
#include "injector.hpp"
#include "key.hpp"
#include "members.hpp"

#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <typeindex>
#include <type_traits>
#include <vector>

namespace wheatgrass {

// ---------------------------------------------------------------
// root_injector_builder
// ---------------------------------------------------------------

/// Accumulates bindings from constants, child contexts and member
/// scanning, then freezes them into an injector:
///
///     auto inj = wheatgrass::new_injector()
///         .with_constants(some_constant, some_other_constant)
///         .with_constant<foo>(some_foo_subclass_instance)
///         .with_context(some_context, some_other_context)
///         .with_members(some_object, some_other_object)
///         .build();
///
/// A builder is single-use: every call after build() throws
/// configuration_error.
class WHEATGRASS_EXPORT root_injector_builder {
public:
    root_injector_builder();
    ~root_injector_builder();

    root_injector_builder(const root_injector_builder&) = delete;
    root_injector_builder& operator=(const root_injector_builder&) = delete;
    root_injector_builder(root_injector_builder&&) noexcept;
    root_injector_builder& operator=(root_injector_builder&&) noexcept;

    // ===============================================================
    // Constants
    // ===============================================================

    /// Bind each constant to its runtime class.
    template <typename... T>
    root_injector_builder& with_constants(const std::shared_ptr<T>&... constants) {
        (add_runtime_constant(constants), ...);
        return *this;
    }

    /// Bind a constant to T, any base of its class.
    template <typename T, typename U>
        requires std::is_same_v<T, U> || std::is_base_of_v<T, U>
    root_injector_builder& with_constant(const std::shared_ptr<U>& constant,
                                         std::source_location loc = std::source_location::current()) {
        if (!constant) {
            throw configuration_error("null constant for " + internal::demangle(typeid(T)), loc);
        }
        std::shared_ptr<T> as_base = constant;
        add_binding(key::of<T>(), detail::erase(as_base), "with_constant", loc);
        return *this;
    }

    /// Bind a constant to an explicit key whose declared type is T.
    template <typename T>
    root_injector_builder& with_constant(const key& k, const std::shared_ptr<T>& constant,
                                         std::source_location loc = std::source_location::current()) {
        if (!constant) {
            throw configuration_error("null constant for " + k.to_string(), loc);
        }
        if (k.type() != std::type_index(typeid(T))) {
            throw configuration_error("key " + k.to_string() + " cannot bind a constant of type "
                                      + internal::demangle(typeid(T)), loc);
        }
        add_binding(k, detail::erase(constant), "with_constant", loc);
        return *this;
    }

    // ===============================================================
    // Contexts
    // ===============================================================

    /// Merge every binding of each context (an injector is a context).
    template <typename... C>
        requires (std::is_base_of_v<context, C> && ...)
    root_injector_builder& with_context(const C&... contexts) {
        (merge_context(contexts), ...);
        return *this;
    }

    // ===============================================================
    // Members
    // ===============================================================

    /// Scan each object through introspect<T> and merge the bindings it
    /// exposes.
    template <typename... T>
    root_injector_builder& with_members(const std::shared_ptr<T>&... objects) {
        (add_members(objects), ...);
        return *this;
    }

    // ===============================================================
    // Build
    // ===============================================================

    std::shared_ptr<injector> build(build_options options = {},
                                    std::source_location loc = std::source_location::current());

    /// Freeze the bindings into a plain context, for composition into
    /// other builders.
    context build_context(build_options options = {},
                          std::source_location loc = std::source_location::current());

    /// Bindings accumulated so far, in registration order.
    const std::vector<binding>& pending() const;

private:
    template <typename T>
    void add_runtime_constant(const std::shared_ptr<T>& constant,
                              std::source_location loc = std::source_location::current()) {
        if (!constant) {
            throw configuration_error("null constant of static type "
                                      + internal::demangle(typeid(T)), loc);
        }
        if constexpr (std::is_polymorphic_v<T>) {
            // Keyed and stored by the most-derived object.
            const void* most_derived = dynamic_cast<const void*>(constant.get());
            add_binding(key(typeid(*constant)),
                        std::shared_ptr<void>(constant, const_cast<void*>(most_derived)),
                        "with_constants", loc);
        } else {
            add_binding(key::of<T>(), detail::erase(constant), "with_constants", loc);
        }
    }

    template <typename T>
    void add_members(const std::shared_ptr<T>& object,
                     std::source_location loc = std::source_location::current()) {
        ensure_open(loc);
        if (!object) {
            throw configuration_error("null member object of type "
                                      + internal::demangle(typeid(T)), loc);
        }
        members<T> exposed(object);
        introspect<T>::describe(exposed);
        merge_scanned(scan_members(std::move(exposed).take()));
    }

    void add_binding(key k, std::shared_ptr<void> instance,
                     std::string api_name, std::source_location loc);
    void merge_context(const context& ctx);
    void merge_scanned(std::vector<binding> scanned);
    void ensure_open(std::source_location loc) const;

    std::shared_ptr<binding_table> freeze(const build_options& options,
                                          std::source_location loc);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Start a new root injector.
WHEATGRASS_EXPORT root_injector_builder new_injector();

} // namespace wheatgrass
