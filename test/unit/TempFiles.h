#pragma once

#include <catch2/catch_test_macros.hpp>

#include <deskboot/sys/file.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

class TemporaryDirectory {
public:
  TemporaryDirectory() {
    auto pattern =
      (std::filesystem::temp_directory_path() / "deskboot-unit-test-XXXXXX")
        .string();
    REQUIRE(mkdtemp(pattern.data()) != nullptr);
    dir = pattern;
  }
  TemporaryDirectory(const TemporaryDirectory&) = delete;
  TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

  ~TemporaryDirectory() {
    if (!dir.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(dir, ec);
    }
  }

  std::filesystem::path dir;
};

inline void
writeFile(const std::filesystem::path& path, std::string_view txt) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream ofs(path.string());
  REQUIRE(ofs.is_open());

  ofs << txt;
}

/// Writes an executable `/bin/sh` script.
inline void
writeScript(const std::filesystem::path& path, std::string_view body) {
  writeFile(path, "#!/bin/sh\n" + std::string(body) + "\n");
  REQUIRE(::chmod(path.c_str(), 0755) == 0);
}

inline std::string
fileContent(const std::filesystem::path& path) {
  auto content = deskboot::sys::readFile(path);
  return content.has_value() ? *content : "";
}

inline mode_t
permissionsOf(const std::filesystem::path& path) {
  auto mode = deskboot::sys::permissions(path);
  REQUIRE(mode.has_value());
  return *mode;
}

/// Detached processes write their logs asynchronously, poll until `pred`
/// holds for the file content.
inline std::string
waitForContent(const std::filesystem::path& path,
               const std::function<bool(const std::string&)>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  auto content = fileContent(path);
  while (!pred(content) && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    content = fileContent(path);
  }
  return content;
}

inline std::string
waitForLine(const std::filesystem::path& path, std::string_view line) {
  return waitForContent(path, [line](const std::string& content) {
    std::istringstream ss(content);
    for (std::string l; std::getline(ss, l);) {
      if (l == line) {
        return true;
      }
    }
    return false;
  });
}

/// Kills the given processes when the test ends.
struct ProcessReaper {
  std::vector<pid_t> pids;

  ~ProcessReaper() {
    for (auto pid : pids) {
      if (pid > 0) {
        ::kill(pid, SIGKILL);
      }
    }
  }
};
