#include "streamkit/utility/fd_stream.h"

#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <span>

namespace streamkit {
namespace utility {

namespace {

IOResult failureFromErrno(int err)
{
    if (err == EAGAIN || err == EWOULDBLOCK) {
        return IOResult::failure(IOResult::Error::WouldBlock);
    }

    return IOResult::failure(IOResult::Error::SystemError, 0, err);
}

}  // namespace

ReadFunction fileDescriptorReader(int fd)
{
    return [fd](std::span<uint8_t> buffer) {
        ssize_t n;
        do {
            n = ::read(fd, buffer.data(), buffer.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            return failureFromErrno(errno);
        }

        if (n == 0 && !buffer.empty()) {
            return IOResult::failure(IOResult::Error::EndOfFile);
        }

        return IOResult::success(static_cast<size_t>(n));
    };
}

WriteFunction fileDescriptorWriter(int fd)
{
    return [fd](std::span<const uint8_t> buffer) {
        ssize_t n;
        do {
            n = ::write(fd, buffer.data(), buffer.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            return failureFromErrno(errno);
        }

        return IOResult::success(static_cast<size_t>(n));
    };
}

}  // namespace utility
}  // namespace streamkit
