#pragma once

#include "export.hpp"
#include "key.hpp"

#include <stdexcept>
#include <string>
#include <string_view>
#include <source_location>
#include <vector>

namespace wheatgrass {

class WHEATGRASS_EXPORT wheatgrass_error : public std::runtime_error {
public:
    explicit wheatgrass_error(const std::string& message,
                              std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

    /// Record that the error passed through the resolution of `k`.  Each
    /// enclosing layer appends its key, innermost first, and what() shows
    /// the chain, e.g.:
    ///   "... (while resolving Db (name="db") -> Service)"
    void append_resolution_context(const key& k);

    /// Keys being resolved when the error was raised, innermost first.
    const std::vector<key>& resolution_chain() const noexcept { return resolution_chain_; }

    const char* what() const noexcept override;

private:
    std::source_location location_;
    std::string diagnostic_detail_;
    std::vector<key> resolution_chain_;
    mutable std::string cached_what_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

/// Null inputs, mismatched keys, builder reuse.
class WHEATGRASS_EXPORT configuration_error : public wheatgrass_error {
public:
    explicit configuration_error(const std::string& message,
                                 std::source_location loc = std::source_location::current());
};

/// Two bindings for one key under collision_policy::reject.
class WHEATGRASS_EXPORT duplicate_binding : public configuration_error {
public:
    explicit duplicate_binding(const key& bound_key,
                               std::source_location loc = std::source_location::current());

    const key& bound_key() const noexcept { return key_; }

private:
    key key_;
};

class WHEATGRASS_EXPORT unresolved_binding : public wheatgrass_error {
public:
    explicit unresolved_binding(const key& requested,
                                std::source_location loc = std::source_location::current());

    /// Construct with an additional diagnostic hint (appended to the message).
    unresolved_binding(const key& requested, std::string_view hint,
                       std::source_location loc = std::source_location::current());

    const key& requested_key() const noexcept { return key_; }

private:
    key key_;
};

class WHEATGRASS_EXPORT cyclic_binding : public wheatgrass_error {
public:
    explicit cyclic_binding(const std::vector<key>& cycle,
                            std::source_location loc = std::source_location::current());

    const std::vector<key>& cycle() const noexcept { return cycle_; }

private:
    std::vector<key> cycle_;
    static std::string build_message(const std::vector<key>& cycle);
};

/// A factory, provider or method threw something other than a wheatgrass_error.
class WHEATGRASS_EXPORT resolution_error : public wheatgrass_error {
public:
    resolution_error(const key& bound_key, const std::exception& inner,
                     std::source_location registration_loc);

    const key& bound_key() const noexcept { return key_; }

private:
    key key_;
};

} // namespace wheatgrass
