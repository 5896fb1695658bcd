#pragma once

// Private to the library sources.

#include "wheatgrass/binding.hpp"
#include "wheatgrass/logging.hpp"

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>

#include <string>

namespace wheatgrass::internal {

using library_logger_type = boost::log::sources::severity_channel_logger_mt<
    boost::log::trivial::severity_level, std::string>;

/// The library logger; every record carries Channel = log_channel.
BOOST_LOG_GLOBAL_LOGGER(library_logger, library_logger_type)

/// The registration stack trace of `desc`, headed by its key and the API
/// that registered it:
///   "Registration stacktrace for Db (name="db") (called via with_constant):\n #0 ..."
/// Empty when no trace was captured.
std::string format_registration_trace(const binding& desc);

} // namespace wheatgrass::internal

#define WHEATGRASS_LOG(level) \
    BOOST_LOG_SEV(::wheatgrass::internal::library_logger::get(), ::boost::log::trivial::level)
