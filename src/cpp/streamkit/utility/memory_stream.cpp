#include "streamkit/utility/memory_stream.h"

#include <algorithm>
#include <utility>

namespace streamkit {
namespace utility {

IOResult MemoryStream::read(std::span<uint8_t> buffer) noexcept
{
    if (remaining() == 0) {
        return IOResult::failure(IOResult::Error::EndOfFile);
    }

    const size_t toCopy = std::min(remaining(), buffer.size());
    std::copy_n(_buffer.cbegin() + _position, toCopy, buffer.begin());
    _position += toCopy;

    return IOResult::success(toCopy);
}

IOResult MemoryStream::write(std::span<const uint8_t> buffer)
{
    _buffer.insert(_buffer.end(), buffer.begin(), buffer.end());
    return IOResult::success(buffer.size());
}

IOResult MemoryStream::writeTo(const WriteFunction& destination)
{
    std::span<const uint8_t> unread = std::span<const uint8_t>(_buffer).subspan(_position);

    IOResult result = writeAll(unread, destination);
    _position += result.bytesTransferred;

    return result;
}

ReadFunction MemoryStream::readFunction() noexcept
{
    return [this](std::span<uint8_t> buffer) { return this->read(buffer); };
}

WriteFunction MemoryStream::writeFunction() noexcept
{
    return [this](std::span<const uint8_t> buffer) { return this->write(buffer); };
}

std::vector<uint8_t> MemoryStream::release() noexcept
{
    _position = 0;
    return std::exchange(_buffer, {});
}

}  // namespace utility
}  // namespace streamkit
