#include "diagnostics.hpp"

#include <boost/log/keywords/channel.hpp>

#include <any>
#include <sstream>
#include <string>

#ifdef WHEATGRASS_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace wheatgrass::internal {

BOOST_LOG_GLOBAL_LOGGER_CTOR_ARGS(library_logger, library_logger_type,
    (boost::log::keywords::channel = std::string(log_channel)))

#ifdef WHEATGRASS_HAS_STACKTRACE

std::any capture_stacktrace() {
    // Skip this frame.
    return std::any(boost::stacktrace::stacktrace(1, static_cast<std::size_t>(-1)));
}

std::string format_registration_trace(const binding& desc) {
    const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&desc.registration_stacktrace);
    if (!trace || trace->empty()) return {};

    std::ostringstream out;
    out << "Registration stacktrace for " << desc.bound_key.to_string();
    if (!desc.api_name.empty()) out << " (called via " << desc.api_name << ")";
    out << ":\n" << *trace;
    return out.str();
}

#else

std::any capture_stacktrace() {
    return {};
}

std::string format_registration_trace(const binding&) {
    return {};
}

#endif

} // namespace wheatgrass::internal
