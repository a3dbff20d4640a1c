#include "deskboot/Environment.h"

#include <unistd.h>

extern char** environ; // NOLINT

namespace deskboot {

Environment
Environment::fromProcess() {
  std::vector<std::string> entries;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; entry++) {
    entries.emplace_back(*entry);
  }
  return fromEntries(entries);
}

Environment
Environment::fromEntries(const std::vector<std::string>& entries) {
  Environment env;
  for (const auto& entry : entries) {
    auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) {
      continue;
    }
    env.set(entry.substr(0, eq), entry.substr(eq + 1));
  }
  return env;
}

void
Environment::set(std::string name, std::string value) {
  mVars.insert_or_assign(std::move(name), std::move(value));
}

void
Environment::unset(std::string_view name) {
  auto it = mVars.find(name);
  if (it != mVars.end()) {
    mVars.erase(it);
  }
}

void
Environment::merge(const Environment& other) {
  for (const auto& [name, value] : other.mVars) {
    set(name, value);
  }
}

std::optional<std::string>
Environment::get(std::string_view name) const {
  auto it = mVars.find(name);
  if (it == mVars.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool
Environment::contains(std::string_view name) const {
  return mVars.find(name) != mVars.end();
}

std::vector<std::string>
Environment::entries() const {
  std::vector<std::string> result;
  result.reserve(mVars.size());
  for (const auto& [name, value] : mVars) {
    result.push_back(name + '=' + value);
  }
  return result;
}

} // namespace deskboot
