#include <catch2/catch_test_macros.hpp>

#include "TempFiles.h"

#include <deskboot/sys/file.h>
#include <deskboot/sys/pipe.h>
#include <deskboot/sys/process.h>

using namespace deskboot::sys;
namespace sys = deskboot::sys;

namespace Catch {
template<typename T>
struct StringMaker<Result<T>> {
  static std::string convert(const Result<T>& value) {
    return value.has_value() ? StringMaker<T>::convert(*value)
                             : "Error: " + sys::to_string(value.error());
  }
};
template<>
struct StringMaker<Result<void>> {
  static std::string convert(const Result<void>& value) {
    return value.has_value() ? "OK"
                             : "Error: " + sys::to_string(value.error());
  }
};
} // namespace Catch

TEST_CASE("error", "[sys]") {
  REQUIRE(to_string(std::errc::invalid_argument) == "Invalid argument");
}

TEST_CASE("FD", "[sys]") {
  TemporaryDirectory tmp;
  writeFile(tmp.dir / "test.txt", "test");

  FD fd;
  SECTION("move") {
    auto res = sys::open((tmp.dir / "test.txt").c_str(), O_RDONLY);
    REQUIRE(res.has_value());
    fd = std::move(*res);

    REQUIRE(fd.isValid());
    REQUIRE_FALSE(res->isValid());
  }

  FD fd2 = std::move(fd);
  REQUIRE_FALSE(fd.isValid());
  fd2.close();
  REQUIRE_FALSE(fd2.isValid());
}

TEST_CASE("readFile", "[sys]") {
  TemporaryDirectory tmp;

  SECTION("non existing") {
    auto err = readFile(tmp.dir / "doesn't_exist.txt");
    REQUIRE_FALSE(err.has_value());
    REQUIRE(err.error() == std::errc::no_such_file_or_directory);
  }

  SECTION("basic reading") {
    writeFile(tmp.dir / "test.txt", "test");
    auto result = readFile(tmp.dir / "test.txt");
    REQUIRE(result.has_value());
    REQUIRE(*result == "test");
  }

  SECTION("larger than one chunk") {
    const std::string big(10000, 'x');
    writeFile(tmp.dir / "big.txt", big);
    auto result = readFile(tmp.dir / "big.txt");
    REQUIRE(result.has_value());
    REQUIRE(*result == big);
  }

  SECTION("empty file") {
    writeFile(tmp.dir / "empty.txt", "");
    auto result = readFile(tmp.dir / "empty.txt");
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
  }
}

TEST_CASE("makeDirectories", "[sys]") {
  TemporaryDirectory tmp;

  REQUIRE(makeDirectories(tmp.dir / "a" / "b" / "c"));
  REQUIRE(std::filesystem::is_directory(tmp.dir / "a" / "b" / "c"));

  // Again, already existing.
  REQUIRE(makeDirectories(tmp.dir / "a" / "b" / "c"));

  writeFile(tmp.dir / "file", "x");
  REQUIRE_FALSE(makeDirectories(tmp.dir / "file").has_value());
  REQUIRE_FALSE(makeDirectories(tmp.dir / "file" / "sub").has_value());
}

TEST_CASE("symlink and rename", "[sys]") {
  TemporaryDirectory tmp;
  const auto link = tmp.dir / "link";

  REQUIRE(sys::symlink("/some/target", link.c_str()));
  REQUIRE(sys::readlink(link) == "/some/target");

  REQUIRE_FALSE(sys::symlink("/other", link.c_str()).has_value());

  REQUIRE(sys::rename(link.c_str(), (tmp.dir / "moved").c_str()));
  REQUIRE(sys::readlink(tmp.dir / "moved") == "/some/target");
  REQUIRE(sys::readlink(link).error() == std::errc::no_such_file_or_directory);
}

TEST_CASE("permissions", "[sys]") {
  TemporaryDirectory tmp;
  const auto path = tmp.dir / "file";
  writeFile(path, "");

  REQUIRE(sys::chmod(path.c_str(), 0600));
  REQUIRE(permissions(path) == mode_t(0600));

  auto fd = sys::open(path.c_str(), O_RDONLY);
  REQUIRE(fd.has_value());
  REQUIRE(sys::fchmod(*fd, 0640));
  REQUIRE(permissions(path) == mode_t(0640));
}

TEST_CASE("pipe", "[sys]") {
  auto pipe = sys::pipe();
  REQUIRE(pipe.has_value());

  auto [readFd, writeFd] = std::move(*pipe);

  REQUIRE_FALSE(readFd.writeValue(12));

  struct Test {
    int a;
    float b;
  };

  REQUIRE(writeFd.writeValue(Test{ 55, 1.2f }));

  auto res = readFd.readExact<Test>();
  REQUIRE(res.has_value());
  REQUIRE(res->a == 55);
  REQUIRE(res->b == 1.2f);

  writeFd.close();
  REQUIRE(readFd.readExact<int>().error() == FD::eof_error);
}

TEST_CASE("waitFor", "[sys]") {
  SECTION("exit status") {
    auto pid = sys::fork();
    REQUIRE(pid.has_value());
    if (*pid == 0) {
      ::_exit(3);
    }

    auto status = waitFor(*pid);
    REQUIRE(status.has_value());
    CHECK(status->type == ExitStatus::Exited);
    CHECK(status->value == 3);
    CHECK_FALSE(status->success());
    CHECK(to_string(*status) == "exited with status 3");
  }

  SECTION("signal") {
    auto pid = sys::fork();
    REQUIRE(pid.has_value());
    if (*pid == 0) {
      ::pause();
      ::_exit(0);
    }

    REQUIRE(sys::kill(*pid, SIGKILL));
    auto status = waitFor(*pid);
    REQUIRE(status.has_value());
    CHECK(status->type == ExitStatus::Signaled);
    CHECK(status->value == SIGKILL);
  }

  SECTION("not a child") {
    auto status = waitFor(1);
    REQUIRE_FALSE(status.has_value());
    CHECK(status.error() == std::errc::no_child_process);
  }
}

TEST_CASE("exec status", "[sys]") {
  SECTION("successful exec closes the pipe") {
    auto statusPipe = sys::pipe();
    REQUIRE(statusPipe.has_value());

    auto pid = sys::fork();
    REQUIRE(pid.has_value());
    if (*pid == 0) {
      ::execl("/bin/sh", "/bin/sh", "-c", "exit 0", nullptr);
      reportExecFailure(statusPipe->writePipe);
    }

    statusPipe->writePipe.close();
    CHECK(readExecStatus(statusPipe->readPipe));
    REQUIRE(waitFor(*pid).has_value());
  }

  SECTION("failed exec reports errno") {
    auto statusPipe = sys::pipe();
    REQUIRE(statusPipe.has_value());

    auto pid = sys::fork();
    REQUIRE(pid.has_value());
    if (*pid == 0) {
      ::execl("/does/not/exist", "/does/not/exist", nullptr);
      reportExecFailure(statusPipe->writePipe);
    }

    statusPipe->writePipe.close();
    auto res = readExecStatus(statusPipe->readPipe);
    REQUIRE_FALSE(res.has_value());
    CHECK(res.error() == std::errc::no_such_file_or_directory);

    auto status = waitFor(*pid);
    REQUIRE(status.has_value());
    CHECK(status->value == 127);
  }
}
