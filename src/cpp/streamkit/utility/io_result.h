#pragma once

#include <cstddef>
#include <optional>

namespace streamkit {
namespace utility {

// The result of a single, possibly non-blocking, I/O action.
struct IOResult {
    // SystemError carries the errno of the failing call in `systemErrno`.
    enum class Error { WouldBlock, EndOfFile, SystemError };

    std::optional<Error> error;
    size_t bytesTransferred;
    int systemErrno {0};

    static IOResult success(size_t bytesTransferred = 0) { return IOResult(std::nullopt, bytesTransferred); }

    static IOResult failure(Error error, size_t bytesTransferred = 0, int systemErrno = 0)
    {
        return IOResult(error, bytesTransferred, systemErrno);
    }
};

}  // namespace utility
}  // namespace streamkit
