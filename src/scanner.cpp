#include "wheatgrass/members.hpp"

#include "diagnostics.hpp"

#include <type_traits>
#include <variant>

namespace wheatgrass {

namespace {

key member_key(const std::string& name, std::type_index type,
               const std::vector<std::type_index>& tags) {
    key k(type, name);
    for (auto tag : tags) k = k.qualified(tag);
    return k;
}

binding from_field(field_member&& m) {
    binding b;
    b.api_name = "with_members (field \"" + m.name + "\")";
    b.registration_location = m.location;
    b.registration_stacktrace = internal::capture_stacktrace();

    if (m.provided_type.has_value()) {
        // Provider field: bound to the wrapped type, not invoked here.
        b.bound_key = member_key(m.name, *m.provided_type, m.qualifiers);
        b.kind = binding_kind::provider;
        b.invoke = std::move(m.invoke);
    } else {
        b.bound_key = member_key(m.name, m.declared_type, m.qualifiers);
        b.kind = binding_kind::value;
    }
    b.instance = std::move(m.value);
    return b;
}

binding from_provides(provides_member&& m) {
    binding b;
    b.api_name = "with_members (provides \"" + m.name + "\")";
    b.registration_location = m.location;
    b.registration_stacktrace = internal::capture_stacktrace();
    b.dependencies = std::move(m.arguments);
    b.factory = std::move(m.call);

    if (m.provided_type.has_value()) {
        // The method runs once to yield the provider; get() runs per resolve.
        b.bound_key = member_key(m.name, *m.provided_type, m.qualifiers);
        b.kind = binding_kind::provider;
        b.invoke = std::move(m.invoke);
    } else {
        b.bound_key = member_key(m.name, m.return_type, m.qualifiers);
        b.kind = binding_kind::value;
    }
    return b;
}

binding from_transform(transform_member&& m) {
    binding b;
    b.api_name = "with_members (transform \"" + m.name + "\")";
    b.registration_location = m.location;
    b.registration_stacktrace = internal::capture_stacktrace();
    b.bound_key = member_key(m.name, m.return_type, m.qualifiers);
    // Kind follows the rebound binding; settled when the injector is built.
    b.kind = binding_kind::value;
    b.rebinds = m.argument.target;
    b.dependencies.push_back(std::move(m.argument));
    b.transform = std::move(m.call);
    return b;
}

} // namespace

std::vector<binding> scan_members(std::vector<member> exposed) {
    std::vector<binding> result;
    result.reserve(exposed.size());

    for (auto& entry : exposed) {
        result.push_back(std::visit([](auto&& m) -> binding {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, field_member>) {
                return from_field(std::move(m));
            } else if constexpr (std::is_same_v<M, provides_member>) {
                return from_provides(std::move(m));
            } else {
                return from_transform(std::move(m));
            }
        }, std::move(entry)));
        WHEATGRASS_LOG(trace) << "scanned " << to_string(result.back().kind)
                              << " binding " << result.back().bound_key.to_string();
    }
    return result;
}

} // namespace wheatgrass
