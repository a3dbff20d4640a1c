#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskboot {

/// Environment variables handed to launched processes. Each step receives the
/// environment explicitly and adds what later steps need, instead of
/// modifying the launcher's own environment.
class Environment {
public:
  Environment() = default;

  /// Snapshot of the current process environment.
  static Environment fromProcess();

  /// Parses `NAME=value` entries, later entries win.
  static Environment fromEntries(const std::vector<std::string>& entries);

  void set(std::string name, std::string value);
  void unset(std::string_view name);
  void merge(const Environment& other);

  std::optional<std::string> get(std::string_view name) const;
  bool contains(std::string_view name) const;

  std::size_t size() const { return mVars.size(); }

  /// `NAME=value` strings, sorted by name.
  std::vector<std::string> entries() const;

private:
  std::map<std::string, std::string, std::less<>> mVars;
};

} // namespace deskboot
