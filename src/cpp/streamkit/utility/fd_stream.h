#pragma once

#include "streamkit/utility/io_helpers.h"

namespace streamkit {
namespace utility {

// Stream capabilities over a POSIX file descriptor (pipe, socket, regular file, tty).
//
// The descriptor is borrowed: it is neither duplicated nor closed and must stay open while the returned function is
// used. Each call performs a single read(2) / write(2), restarted on EINTR:
//   - read(2) returning 0 is an EndOfFile failure
//   - EAGAIN / EWOULDBLOCK on a non-blocking descriptor is a WouldBlock failure
//   - any other errno is a SystemError failure carrying that errno
ReadFunction fileDescriptorReader(int fd);
WriteFunction fileDescriptorWriter(int fd);

}  // namespace utility
}  // namespace streamkit
