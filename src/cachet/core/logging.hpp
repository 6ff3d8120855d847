#ifndef CACHET_CORE_LOGGING_HPP
#define CACHET_CORE_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <cachet/fs/types.hpp>

namespace cachet {

// cachet writes all of its log messages to the spdlog logger named "cachet".
// An application that wants to control where they go can register its own
// logger under that name before creating any cachet objects.

// Register the "cachet" logger if it doesn't exist yet. The logger writes to
// the console and, if :log_file is given, to a rotating log file.
// If the logger already exists, this does nothing.
void
initialize_logging(optional<file_path> const& log_file = none);

// Set the level of the "cachet" logger from its textual name ("debug",
// "info", "warn", etc.).
void
set_log_level(string const& level);

} // namespace cachet

#endif
