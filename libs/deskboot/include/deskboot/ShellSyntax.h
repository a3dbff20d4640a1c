#pragma once

#include "Environment.h"
#include "Error.h"

#include <string>
#include <string_view>

namespace deskboot {

/// Parses the `--sh-syntax` output of the bus launcher:
///
///   DBUS_SESSION_BUS_ADDRESS='unix:path=/tmp/dbus-x,guid=y';
///   export DBUS_SESSION_BUS_ADDRESS;
///   DBUS_SESSION_BUS_PID=1234;
///
/// Values may be single quoted, with `'\''` standing for a quote. Export
/// lines, comments and blank lines are skipped.
ErrorOr<Environment>
parseShellAssignments(std::string_view text);

/// Inverse of the quoting accepted by `parseShellAssignments`.
std::string
shellQuote(std::string_view value);

} // namespace deskboot
