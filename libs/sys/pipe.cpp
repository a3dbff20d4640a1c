#include "deskboot/sys/pipe.h"

#include <fcntl.h>

#include <array>

namespace deskboot::sys {

Result<Pipe>
pipe() {
  std::array<int, 2> fds{};
  int res = ::pipe2(fds.data(), O_CLOEXEC);
  if (res == -1) {
    return tl::unexpected(getErrno());
  }

  return Pipe{ FD{ fds[0] }, FD{ fds[1] } };
}

} // namespace deskboot::sys
