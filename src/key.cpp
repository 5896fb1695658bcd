#include "wheatgrass/key.hpp"

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <tuple>
#include <unordered_map>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace wheatgrass {

namespace internal {

namespace {

std::string demangle_name(const char* mangled) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);
    if (status == 0 && demangled) return demangled.get();
#endif
    return mangled;
}

} // namespace

// Demangled names are cached per type.
std::string demangle(std::type_index type) {
    static std::mutex names_mutex;
    static std::unordered_map<std::type_index, std::string> names;

    std::lock_guard lock(names_mutex);
    auto it = names.find(type);
    if (it == names.end()) {
        it = names.emplace(type, demangle_name(type.name())).first;
    }
    return it->second;
}

} // namespace internal

key::key()
    : type_(typeid(void))
    , generic_(typeid(void))
{}

key::key(std::type_index type, std::string_view name)
    : type_(type)
    , generic_(type)
{
    if (!name.empty()) name_ = std::string(name);
}

bool key::has_qualifiers_of(const key& other) const {
    // both sorted
    return std::includes(qualifiers_.begin(), qualifiers_.end(),
                         other.qualifiers_.begin(), other.qualifiers_.end());
}

key key::with_name(std::string_view name) const {
    key k = *this;
    if (name.empty()) {
        k.name_.reset();
    } else {
        k.name_ = std::string(name);
    }
    return k;
}

key key::without_name() const {
    key k = *this;
    k.name_.reset();
    return k;
}

key key::qualified(std::type_index tag) const {
    key k = *this;
    auto pos = std::lower_bound(k.qualifiers_.begin(), k.qualifiers_.end(), tag);
    if (pos == k.qualifiers_.end() || *pos != tag) {
        k.qualifiers_.insert(pos, tag);
    }
    return k;
}

key key::with_generic(std::type_index generic) const {
    key k = *this;
    k.generic_ = generic;
    return k;
}

std::optional<key> key::unwrapped() const {
    if (!provided_.has_value()) return std::nullopt;
    key k(*provided_);
    k.name_ = name_;
    k.qualifiers_ = qualifiers_;
    return k;
}

std::string key::to_string() const {
    std::string s = internal::demangle(type_);
    if (generic_ != type_) {
        s += " <" + internal::demangle(generic_) + ">";
    }
    if (name_.has_value()) {
        s += " (name=\"" + *name_ + "\")";
    }
    if (!qualifiers_.empty()) {
        s += " {";
        for (std::size_t i = 0; i < qualifiers_.size(); ++i) {
            if (i > 0) s += ", ";
            s += internal::demangle(qualifiers_[i]);
        }
        s += "}";
    }
    return s;
}

bool key::operator==(const key& other) const {
    return type_ == other.type_
        && generic_ == other.generic_
        && name_ == other.name_
        && qualifiers_ == other.qualifiers_;
}

bool key::operator<(const key& other) const {
    return std::tie(type_, generic_, name_, qualifiers_)
         < std::tie(other.type_, other.generic_, other.name_, other.qualifiers_);
}

} // namespace wheatgrass
