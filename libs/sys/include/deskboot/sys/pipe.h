#pragma once

#include "fd.h"

namespace deskboot::sys {

struct Pipe {
  FD readPipe;
  FD writePipe;
};

/// Both ends are close-on-exec.
Result<Pipe>
pipe();

} // namespace deskboot::sys
