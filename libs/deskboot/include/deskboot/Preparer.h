#pragma once

#include "Config.h"
#include "Environment.h"
#include "Error.h"

#include <filesystem>
#include <string>
#include <vector>

namespace deskboot {

/// Creates every directory (and its parents) that doesn't exist yet.
OptError<>
prepareDirectories(const std::vector<std::filesystem::path>& dirs);

/// 32 lowercase hex digits read from the kernel random source.
ErrorOr<std::string>
generateMachineId();

/// Writes a new machine id to `path` unless the file already exists.
/// \returns True if a new id was written.
ErrorOr<bool>
ensureMachineId(const std::filesystem::path& path);

/// Creates the runtime directory if needed and restricts it to its owner.
OptError<>
ensureRuntimeDir(const std::filesystem::path& path);

/// All of the above, in order. Exports the runtime directory to `env`.
OptError<>
prepareEnvironment(const EnvironmentConfig& config, Environment& env);

} // namespace deskboot
