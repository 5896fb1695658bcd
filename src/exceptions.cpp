#include "wheatgrass/exceptions.hpp"

#include <exception>
#include <string>

namespace wheatgrass {

std::string wheatgrass_error::format_message(const std::string& msg,
                                             const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

wheatgrass_error::wheatgrass_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void wheatgrass_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

void wheatgrass_error::append_resolution_context(const key& k) {
    resolution_chain_.push_back(k);
    cached_what_.clear();
}

const char* wheatgrass_error::what() const noexcept {
    if (resolution_chain_.empty()) {
        return std::runtime_error::what();
    }
    if (cached_what_.empty()) {
        try {
            std::string chain;
            for (const auto& k : resolution_chain_) {
                if (!chain.empty()) chain += " -> ";
                chain += k.to_string();
            }
            cached_what_ = std::string(std::runtime_error::what())
                           + " (while resolving " + chain + ")";
        } catch (const std::exception&) {
            // Out of memory or length: fall back to the bare message.
            cached_what_.clear();
            return std::runtime_error::what();
        }
    }
    return cached_what_.c_str();
}

std::string wheatgrass_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

configuration_error::configuration_error(const std::string& message,
                                         std::source_location loc)
    : wheatgrass_error("Configuration error: " + message, loc)
{}

duplicate_binding::duplicate_binding(const key& bound_key, std::source_location loc)
    : configuration_error("duplicate binding for " + bound_key.to_string(), loc)
    , key_(bound_key)
{}

unresolved_binding::unresolved_binding(const key& requested, std::source_location loc)
    : wheatgrass_error("Binding not found: " + requested.to_string(), loc)
    , key_(requested)
{}

unresolved_binding::unresolved_binding(const key& requested, std::string_view hint,
                                       std::source_location loc)
    : wheatgrass_error([&]() {
          std::string msg = "Binding not found: " + requested.to_string();
          if (!hint.empty())
              msg += "; " + std::string(hint);
          return msg;
      }(), loc)
    , key_(requested)
{}

std::string cyclic_binding::build_message(const std::vector<key>& cycle) {
    std::string msg = "Cyclic binding detected: ";
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) msg += " -> ";
        msg += cycle[i].to_string();
    }
    return msg;
}

cyclic_binding::cyclic_binding(const std::vector<key>& cycle, std::source_location loc)
    : wheatgrass_error(build_message(cycle), loc)
    , cycle_(cycle)
{}

resolution_error::resolution_error(const key& bound_key,
                                   const std::exception& inner,
                                   std::source_location registration_loc)
    : wheatgrass_error([&]() {
          std::string msg = "Failed to resolve " + bound_key.to_string()
                            + ": " + inner.what();
          if (registration_loc.file_name()[0]) {
              msg += " (registered at " + std::string(registration_loc.file_name())
                     + ":" + std::to_string(registration_loc.line()) + ")";
          }
          return msg;
      }(), registration_loc)
    , key_(bound_key)
{}

} // namespace wheatgrass
