#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include "streamkit/utility/io_helpers.h"
#include "streamkit/utility/io_result.h"

namespace streamkit {
namespace utility {

// A growable in-memory byte stream.
//
// Writes append at the end of the stream, reads consume from a cursor that starts at the beginning. Reading past the
// written data returns an EndOfFile failure.
class MemoryStream {
public:
    MemoryStream() noexcept = default;
    explicit MemoryStream(std::vector<uint8_t> data) noexcept: _buffer(std::move(data)), _position(0) {}

    MemoryStream(MemoryStream&&) noexcept            = default;
    MemoryStream& operator=(MemoryStream&&) noexcept = default;

    MemoryStream(const MemoryStream&)            = delete;
    MemoryStream& operator=(const MemoryStream&) = delete;

    // Read up to buffer.size() bytes from the current position.
    IOResult read(std::span<uint8_t> buffer) noexcept;

    // Append the whole buffer at the end of the stream.
    IOResult write(std::span<const uint8_t> buffer);

    // Hand all the unread bytes to `destination`, advancing the position by the number of bytes it accepted.
    IOResult writeTo(const WriteFunction& destination);

    // Adapters usable wherever a ReadFunction or WriteFunction is expected. The stream must outlive them.
    ReadFunction readFunction() noexcept;
    WriteFunction writeFunction() noexcept;

    size_t size() const noexcept { return _buffer.size(); }
    size_t position() const noexcept { return _position; }
    size_t remaining() const noexcept { return _buffer.size() - _position; }

    void rewind() noexcept { _position = 0; }

    const std::vector<uint8_t>& buffer() const noexcept { return _buffer; }

    // Move the written bytes out of the stream, leaving it empty.
    std::vector<uint8_t> release() noexcept;

private:
    std::vector<uint8_t> _buffer;
    size_t _position {0};
};

}  // namespace utility
}  // namespace streamkit
