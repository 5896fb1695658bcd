#pragma once

#include <string_view>

namespace wheatgrass {

/// wheatgrass logs through Boost.Log with `boost::log::trivial` severities,
/// tagged with the "Channel" attribute set to `log_channel`:
///
///   - debug: build summaries, shadowed and dropped bindings
///   - trace: every scanned binding and every lazily produced value
///
/// Boost.Log passes every record to its default console sink until the host
/// configures the core.  To silence the library, filter on the channel:
///
///     namespace expr = boost::log::expressions;
///     boost::log::core::get()->set_filter(
///         expr::attr<std::string>("Channel") != std::string(wheatgrass::log_channel)
///         || boost::log::trivial::severity >= boost::log::trivial::info);
inline constexpr std::string_view log_channel = "wheatgrass";

} // namespace wheatgrass
