#include "streamkit/utility/io_helpers.h"

#include <cstdint>
#include <span>

namespace streamkit {
namespace utility {

IOResult readExact(std::span<uint8_t> buffer, const ReadFunction& reader)
{
    size_t cursor = 0;

    while (cursor < buffer.size()) {
        IOResult result = reader(buffer.subspan(cursor));
        cursor += result.bytesTransferred;

        if (result.error) {
            return IOResult::failure(result.error.value(), cursor, result.systemErrno);
        }

        if (result.bytesTransferred == 0) {
            return IOResult::failure(IOResult::Error::EndOfFile, cursor);
        }
    }

    return IOResult::success(cursor);
}

IOResult writeAll(std::span<const uint8_t> buffer, const WriteFunction& writer)
{
    size_t cursor = 0;

    while (cursor < buffer.size()) {
        IOResult result = writer(buffer.subspan(cursor));
        cursor += result.bytesTransferred;

        if (result.error) {
            return IOResult::failure(result.error.value(), cursor, result.systemErrno);
        }

        if (result.bytesTransferred == 0) {
            return IOResult::failure(IOResult::Error::EndOfFile, cursor);
        }
    }

    return IOResult::success(cursor);
}

}  // namespace utility
}  // namespace streamkit
