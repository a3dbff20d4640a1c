#pragma once

#include "Config.h"
#include "Error.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace deskboot {

struct DriverError {
  enum { NotFound, Io } type;
  std::string msg;
};

inline std::string
to_string(const DriverError& err) { // NOLINT
  return err.type == DriverError::NotFound ? "graphics drivers not found: " +
                                               err.msg
                                           : err.msg;
}

/// Entries of `parent` whose name matches the glob `pattern`, in lexical
/// order.
ErrorOr<std::vector<std::filesystem::path>, DriverError>
findDriverCandidates(const std::filesystem::path& parent,
                     std::string_view pattern);

/// Picks the first candidate. Warns if the choice was ambiguous.
ErrorOr<std::filesystem::path, DriverError>
selectDriver(const std::vector<std::filesystem::path>& candidates);

/// Points `alias` at `target`, replacing whatever link was there.
ErrorOr<void, DriverError>
replaceSymlink(const std::filesystem::path& target,
               const std::filesystem::path& alias);

/// Finds the driver directory and links the alias to it. Nothing is touched
/// if no driver directory exists.
/// \returns The directory the alias points to.
ErrorOr<std::filesystem::path, DriverError>
linkDriver(const DriverConfig& config);

} // namespace deskboot
