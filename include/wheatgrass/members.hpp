#pragma once

#include "export.hpp"
#include "binding.hpp"
#include "exceptions.hpp"
#include "injector.hpp"
#include "key.hpp"
#include "provider.hpp"
#include "type_traits.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <tuple>
#include <typeindex>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace wheatgrass {

/// A zero-size tag type that carries a compile-time list of qualifier tags.
template <typename... Tags>
struct qualifiers_tag {
    static std::vector<std::type_index> types() {
        std::vector<std::type_index> v{std::type_index(typeid(Tags))...};
        std::sort(v.begin(), v.end());
        v.erase(std::unique(v.begin(), v.end()), v.end());
        return v;
    }
};

template <typename... Tags>
inline constexpr qualifiers_tag<Tags...> qualifiers{};

/// Explicit argument keys for a method, in parameter order.
struct arg_keys {
    std::vector<key> keys;
};

template <typename... K>
arg_keys args(K&&... keys) {
    return arg_keys{{key(std::forward<K>(keys))...}};
}

// ---------------------------------------------------------------
// Exposed members: the tagged variant the scanner consumes
// ---------------------------------------------------------------

struct field_member {
    std::string name;
    std::type_index declared_type = std::type_index(typeid(void));
    std::vector<std::type_index> qualifiers;
    std::shared_ptr<void> value;                  // current value of the field
    std::optional<std::type_index> provided_type; // X for provider<X> fields
    provider_call_fn invoke;
    std::source_location location;
};

struct provides_member {
    std::string name;
    std::type_index return_type = std::type_index(typeid(void));
    std::vector<std::type_index> qualifiers;
    std::optional<std::type_index> provided_type; // X for methods returning provider<X>
    provider_call_fn invoke;
    std::vector<dependency_info> arguments;
    factory_fn call;
    std::source_location location;
};

struct transform_member {
    std::string name;
    std::type_index return_type = std::type_index(typeid(void));
    std::vector<std::type_index> qualifiers;
    dependency_info argument;
    transform_fn call;
    std::source_location location;
};

using member = std::variant<field_member, provides_member, transform_member>;

/// Translate exposed members into bindings.
WHEATGRASS_EXPORT std::vector<binding> scan_members(std::vector<member> exposed);

// ---------------------------------------------------------------
// Helpers: argument injection and result wrapping
// ---------------------------------------------------------------
namespace detail {

template <typename U>
std::shared_ptr<void> erase(const std::shared_ptr<U>& p) {
    return std::shared_ptr<void>(p, const_cast<void*>(static_cast<const void*>(p.get())));
}

template <typename Owner, typename U>
std::shared_ptr<void> alias(const std::shared_ptr<Owner>& owner, U& ref) {
    return std::shared_ptr<void>(
        owner, const_cast<void*>(static_cast<const void*>(std::addressof(ref))));
}

template <typename X>
provider_call_fn provider_call() {
    return [](const std::shared_ptr<void>& p) -> std::shared_ptr<void> {
        return erase(std::static_pointer_cast<provider<X>>(p)->get());
    };
}

/// How one method parameter of declared type A is injected.
template <typename A>
struct arg_traits {
    using shape       = shape_of<A>;
    using value_type  = typename shape::value_type;
    using holder_type = std::conditional_t<shape::is_provider,
                                           std::shared_ptr<provider<value_type>>,
                                           std::shared_ptr<value_type>>;
    static constexpr bool deferred = shape::is_provider;

    static holder_type fetch(injector& inj, const key& k) {
        if constexpr (deferred) {
            return inj.get_provider<value_type>(k);
        } else {
            return inj.get<value_type>(k);
        }
    }

    static A pass(holder_type& holder) {
        if constexpr (shape::is_pointer) {
            return holder;
        } else {
            return *holder;
        }
    }
};

template <typename M, std::size_t I>
using arg_t = std::tuple_element_t<I, typename method_traits<M>::args>;

/// Type-erase the result of `call()`, declared as R.  A reference result may
/// point into the owner or into an injected argument, so it keeps both the
/// owner and `arguments` (the argument holders) alive.
template <typename R, typename Owner, typename Arguments, typename F>
std::shared_ptr<void> wrap_result(const std::shared_ptr<Owner>& owner,
                                  const Arguments& arguments, F&& call) {
    if constexpr (std::is_lvalue_reference_v<R>) {
        auto& ref = call();
        auto keep = std::make_shared<std::pair<std::shared_ptr<Owner>, Arguments>>(owner, arguments);
        return std::shared_ptr<void>(
            std::move(keep), const_cast<void*>(static_cast<const void*>(std::addressof(ref))));
    } else if constexpr (shape_of<R>::is_pointer) {
        return erase(call());
    } else {
        return std::make_shared<value_type_t<R>>(call());
    }
}

template <typename Owner, typename M, std::size_t... I>
std::shared_ptr<void> call_method(const std::shared_ptr<Owner>& owner, M method,
                                  [[maybe_unused]] injector& inj,
                                  [[maybe_unused]] const std::vector<key>& keys,
                                  std::index_sequence<I...>) {
    using R = typename method_traits<M>::return_type;
    // Braced initialization resolves the arguments left to right.
    std::tuple<typename arg_traits<arg_t<M, I>>::holder_type...> holders{
        arg_traits<arg_t<M, I>>::fetch(inj, keys[I])...};
    return wrap_result<R>(owner, holders, [&]() -> R {
        return ((*owner).*method)(arg_traits<arg_t<M, I>>::pass(std::get<I>(holders))...);
    });
}

template <typename M, std::size_t... I>
std::vector<key> default_keys(std::index_sequence<I...>) {
    return {key::of<typename arg_traits<arg_t<M, I>>::value_type>()...};
}

template <typename M, std::size_t... I>
std::vector<std::type_index> arg_types(std::index_sequence<I...>) {
    return {std::type_index(typeid(typename arg_traits<arg_t<M, I>>::value_type))...};
}

template <typename M, std::size_t... I>
std::vector<dependency_info> make_dep_infos(const std::vector<key>& keys,
                                            std::index_sequence<I...>) {
    return {dependency_info{keys[I], arg_traits<arg_t<M, I>>::deferred}...};
}

} // namespace detail

// ---------------------------------------------------------------
// members<T>: explicit registration of an object's exposed members
// ---------------------------------------------------------------

/// Collects the fields and methods an object exposes to the injector.
/// Passed to `introspect<T>::describe` by root_injector_builder::with_members.
template <typename T>
class members {
public:
    explicit members(std::shared_ptr<T> owner) : owner_(std::move(owner)) {}

    const std::shared_ptr<T>& owner() const noexcept { return owner_; }

    /// Expose a field.  `std::shared_ptr<U>` fields are keyed by U and read
    /// now; `std::shared_ptr<provider<X>>` fields become providers of X;
    /// any other field is exposed in place.
    template <typename C, typename F, typename... Q>
        requires std::is_base_of_v<C, T> && (!std::is_function_v<F>)
    members& field(std::string_view name, F C::*ptr,
                   qualifiers_tag<Q...> = {},
                   std::source_location loc = std::source_location::current()) {
        using shape = shape_of<F>;
        using V = typename shape::value_type;

        auto& slot = (*owner_).*ptr;
        field_member m;
        m.name = std::string(name);
        m.qualifiers = qualifiers_tag<Q...>::types();
        m.location = loc;

        if constexpr (shape::is_pointer) {
            if (!slot) {
                throw configuration_error("field \"" + m.name + "\" of "
                                          + internal::demangle(typeid(T)) + " is null", loc);
            }
            m.value = detail::erase(slot);
        } else {
            m.value = detail::alias(owner_, slot);
        }

        if constexpr (shape::is_provider) {
            m.declared_type = typeid(provider<V>);
            m.provided_type = std::type_index(typeid(V));
            m.invoke = detail::provider_call<V>();
        } else {
            m.declared_type = typeid(V);
        }
        exposed_.emplace_back(std::move(m));
        return *this;
    }

    /// Expose a provides-method.  Its arguments are resolved by type.
    template <typename M, typename... Q>
        requires member_function_of<M, T>
              && bindable_return<typename method_traits<M>::return_type>
    members& provides(std::string_view name, M fn,
                      qualifiers_tag<Q...> q = {},
                      std::source_location loc = std::source_location::current()) {
        using seq = std::make_index_sequence<method_traits<M>::arity>;
        return provides(name, fn, arg_keys{detail::default_keys<M>(seq{})}, q, loc);
    }

    /// Expose a provides-method with explicit argument keys.
    template <typename M, typename... Q>
        requires member_function_of<M, T>
              && bindable_return<typename method_traits<M>::return_type>
    members& provides(std::string_view name, M fn, arg_keys keys,
                      qualifiers_tag<Q...> = {},
                      std::source_location loc = std::source_location::current()) {
        using traits = method_traits<M>;
        using R = typename traits::return_type;
        using seq = std::make_index_sequence<traits::arity>;

        check_keys(name, keys.keys, detail::arg_types<M>(seq{}), loc);

        provides_member m;
        m.name = std::string(name);
        m.return_type = typeid(value_type_t<R>);
        m.qualifiers = qualifiers_tag<Q...>::types();
        m.arguments = detail::make_dep_infos<M>(keys.keys, seq{});
        m.location = loc;
        if constexpr (shape_of<R>::is_provider) {
            m.provided_type = std::type_index(typeid(value_type_t<R>));
            m.invoke = detail::provider_call<value_type_t<R>>();
        }
        m.call = [owner = owner_, fn, k = std::move(keys.keys)](injector& inj) {
            return detail::call_method(owner, fn, inj, k, seq{});
        };
        exposed_.emplace_back(std::move(m));
        return *this;
    }

    /// Offer a plain method.  A method taking exactly one argument that is
    /// assignable to its return type becomes a transform of the argument's
    /// binding; any other method is ignored.
    template <typename M, typename... Q>
        requires member_function_of<M, T>
    members& method(std::string_view name, M fn,
                    qualifiers_tag<Q...> q = {},
                    std::source_location loc = std::source_location::current()) {
        if constexpr (transform_shaped<M>) {
            using A = detail::arg_t<M, 0>;
            return method_with(name, fn, key::of<value_type_t<A>>(), q, loc);
        } else {
            return *this;
        }
    }

    /// Offer a plain method whose argument binds to an explicit key.
    template <typename M, typename... Q>
        requires member_function_of<M, T>
    members& method(std::string_view name, M fn, arg_keys keys,
                    qualifiers_tag<Q...> q = {},
                    std::source_location loc = std::source_location::current()) {
        if constexpr (transform_shaped<M>) {
            using A = detail::arg_t<M, 0>;
            check_keys(name, keys.keys, {std::type_index(typeid(value_type_t<A>))}, loc);
            return method_with(name, fn, keys.keys.front(), q, loc);
        } else {
            return *this;
        }
    }

    /// The members collected so far.
    std::vector<member> take() && { return std::move(exposed_); }

private:
    template <typename M, typename... Q>
    members& method_with(std::string_view name, M fn, key source,
                         qualifiers_tag<Q...>, std::source_location loc) {
        using A = detail::arg_t<M, 0>;
        using R = typename method_traits<M>::return_type;

        transform_member m;
        m.name = std::string(name);
        m.return_type = typeid(value_type_t<R>);
        m.qualifiers = qualifiers_tag<Q...>::types();
        m.argument = dependency_info{std::move(source), false};
        m.location = loc;
        m.call = [owner = owner_, fn](injector&, std::shared_ptr<void> value)
                -> std::shared_ptr<void> {
            auto holder = std::static_pointer_cast<value_type_t<A>>(std::move(value));
            return detail::wrap_result<R>(owner, holder, [&]() -> R {
                return ((*owner).*fn)(detail::arg_traits<A>::pass(holder));
            });
        };
        exposed_.emplace_back(std::move(m));
        return *this;
    }

    void check_keys(std::string_view name, const std::vector<key>& keys,
                    const std::vector<std::type_index>& expected,
                    std::source_location loc) const {
        if (keys.size() != expected.size()) {
            throw configuration_error("method \"" + std::string(name) + "\" of "
                                      + internal::demangle(typeid(T)) + " takes "
                                      + std::to_string(expected.size()) + " argument(s), "
                                      + std::to_string(keys.size()) + " key(s) given", loc);
        }
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (keys[i].type() != expected[i]) {
                throw configuration_error("argument " + std::to_string(i) + " of \""
                                          + std::string(name) + "\" expects "
                                          + internal::demangle(expected[i]) + ", key is "
                                          + keys[i].to_string(), loc);
            }
        }
    }

    std::shared_ptr<T> owner_;
    std::vector<member> exposed_;
};

// ---------------------------------------------------------------
// introspect<T>: the introspection hook
// ---------------------------------------------------------------

/// T describes itself through a static `describe_members(members<T>&)`.
template <typename T>
concept self_describing = requires(members<T>& m) { T::describe_members(m); };

/// Specialize for types that cannot carry `describe_members` themselves.
template <typename T>
struct introspect {
    static void describe(members<T>& m) {
        static_assert(self_describing<T>,
            "introspect<T>: give T a static describe_members(members<T>&) "
            "or specialize wheatgrass::introspect<T>");
        if constexpr (self_describing<T>) {
            T::describe_members(m);
        }
    }
};

} // namespace wheatgrass
