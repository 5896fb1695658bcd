#pragma once

/// @file fwd.hpp
/// Forward declarations for all public wheatgrass symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

#include <cstddef>

namespace wheatgrass {

// key.hpp
class key;

// provider.hpp
template <typename T>
class provider;

// binding.hpp
enum class binding_kind;
enum class collision_policy;
struct build_options;
struct dependency_info;
struct binding;

// exceptions.hpp
class wheatgrass_error;
class configuration_error;
class duplicate_binding;
class unresolved_binding;
class cyclic_binding;
class resolution_error;

// context.hpp
struct binding_table;
class context;

// injector.hpp
class injector;

// members.hpp
template <typename... Tags>
struct qualifiers_tag;
struct field_member;
struct provides_member;
struct transform_member;
template <typename T>
class members;
template <typename T>
struct introspect;

// root_injector_builder.hpp
class root_injector_builder;

} // namespace wheatgrass
