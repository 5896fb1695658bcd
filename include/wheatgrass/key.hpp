#pragma once

#include "export.hpp"
#include "provider.hpp"
#include "type_traits.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace wheatgrass {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
WHEATGRASS_EXPORT std::string demangle(std::type_index type);
} // namespace internal

// ---------------------------------------------------------------
// key: identity of a binding
// ---------------------------------------------------------------

/// Identifies a binding by (name, declared type, generic witness,
/// qualifiers).  All four take part in equality and ordering.
///
/// The generic witness defaults to the declared type.  An empty name is the
/// absent name.  Keys are immutable; the modifiers return new keys.
class WHEATGRASS_EXPORT key {
public:
    /// The `void` key.  Never bound; exists so keys can be default-constructed.
    key();

    explicit key(std::type_index type, std::string_view name = {});

    template <typename T>
    static key of() {
        key k(typeid(T));
        if constexpr (is_provider_v<T>) {
            k.provided_ = std::type_index(typeid(typename provider_traits<std::remove_cv_t<T>>::value_type));
        }
        return k;
    }

    template <typename T>
    static key named(std::string_view name) {
        return of<T>().with_name(name);
    }

    const std::optional<std::string>& name() const noexcept { return name_; }
    std::type_index type() const noexcept { return type_; }
    std::type_index generic() const noexcept { return generic_; }

    /// Qualifier tags, sorted and unique.
    const std::vector<std::type_index>& qualifiers() const noexcept { return qualifiers_; }

    bool is_named() const noexcept { return name_.has_value(); }

    /// True when every qualifier of `other` is also a qualifier of this key.
    bool has_qualifiers_of(const key& other) const;

    key with_name(std::string_view name) const;
    key without_name() const;
    key qualified(std::type_index tag) const;
    key with_generic(std::type_index generic) const;

    template <typename Tag>
    key qualified() const { return qualified(typeid(Tag)); }

    template <typename G>
    key with_generic() const { return with_generic(typeid(G)); }

    /// For a key on `provider<X>`, the key on X with the same name and
    /// qualifiers.  Empty for any other key.
    std::optional<key> unwrapped() const;

    std::string to_string() const;

    bool operator==(const key& other) const;
    bool operator!=(const key& other) const { return !(*this == other); }
    bool operator<(const key& other) const;

private:
    std::optional<std::string> name_;
    std::type_index type_;
    std::type_index generic_;
    std::vector<std::type_index> qualifiers_;

    // Derived from type_; not part of identity.
    std::optional<std::type_index> provided_;
};

} // namespace wheatgrass
