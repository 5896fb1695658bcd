#pragma once

#include "fwd.hpp"

#include <memory>
#include <tuple>
#include <type_traits>

namespace wheatgrass {

// ---------------------------------------------------------------
// Provider detection
// ---------------------------------------------------------------

/// `provider<X>` → true, with `value_type` = X.
template <typename T>
struct provider_traits {
    static constexpr bool is_provider = false;
};

template <typename X>
struct provider_traits<provider<X>> {
    static constexpr bool is_provider = true;
    using value_type = X;
};

template <typename T>
inline constexpr bool is_provider_v = provider_traits<std::remove_cv_t<T>>::is_provider;

// ---------------------------------------------------------------
// shape_traits: how a declared member/return/argument type is held
// ---------------------------------------------------------------

/// Primary: a plain `U` (or reference to one).
template <typename D>
struct shape_traits {
    using value_type = std::remove_cvref_t<D>;
    static constexpr bool is_pointer  = false;
    static constexpr bool is_provider = false;
};

/// `std::shared_ptr<U>` → keyed by U, held by pointer.
template <typename U>
struct shape_traits<std::shared_ptr<U>> {
    using value_type = std::remove_cv_t<U>;
    static constexpr bool is_pointer  = true;
    static constexpr bool is_provider = false;
};

/// `std::shared_ptr<provider<X>>` → deferred-provider wrapper around X.
template <typename X>
struct shape_traits<std::shared_ptr<provider<X>>> {
    using value_type = X;
    static constexpr bool is_pointer  = true;
    static constexpr bool is_provider = true;
};

template <typename D>
using shape_of = shape_traits<std::remove_cvref_t<D>>;

template <typename D>
using value_type_t = typename shape_of<D>::value_type;

// ---------------------------------------------------------------
// method_traits: decompose a pointer to member function
// ---------------------------------------------------------------

template <typename M>
struct method_traits;

template <typename T, typename R, typename... Args>
struct method_traits<R (T::*)(Args...)> {
    using owner_type  = T;
    using return_type = R;
    using args        = std::tuple<Args...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

template <typename T, typename R, typename... Args>
struct method_traits<R (T::*)(Args...) const> : method_traits<R (T::*)(Args...)> {};

template <typename T, typename R, typename... Args>
struct method_traits<R (T::*)(Args...) noexcept> : method_traits<R (T::*)(Args...)> {};

template <typename T, typename R, typename... Args>
struct method_traits<R (T::*)(Args...) const noexcept> : method_traits<R (T::*)(Args...)> {};

// ---------------------------------------------------------------
// Concepts
// ---------------------------------------------------------------

/// M is a member function of T.
template <typename M, typename T>
concept member_function_of =
    std::is_member_function_pointer_v<M>
    && std::is_base_of_v<typename method_traits<M>::owner_type, T>;

/// A provides-method must yield something bindable.
template <typename R>
concept bindable_return = !std::is_void_v<R> && !std::is_pointer_v<std::remove_cvref_t<R>>;

namespace detail {

template <typename M>
constexpr bool is_transform_shaped() {
    using traits = method_traits<M>;
    if constexpr (traits::arity != 1 || std::is_void_v<typename traits::return_type>) {
        return false;
    } else {
        using A = std::tuple_element_t<0, typename traits::args>;
        using R = typename traits::return_type;
        if constexpr (shape_of<A>::is_provider || shape_of<R>::is_provider
                      || std::is_pointer_v<std::remove_cvref_t<R>>) {
            return false;
        } else {
            return std::is_same_v<value_type_t<R>, value_type_t<A>>
                || std::is_base_of_v<value_type_t<R>, value_type_t<A>>;
        }
    }
}

} // namespace detail

/// Transformation shape: exactly one non-deferred parameter whose value
/// type is assignable to the (non-provider) return value type.
template <typename M>
concept transform_shaped = detail::is_transform_shaped<M>();

} // namespace wheatgrass
