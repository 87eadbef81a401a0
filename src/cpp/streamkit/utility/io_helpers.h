#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>

#include "streamkit/utility/io_result.h"

namespace streamkit {
namespace utility {

// A readable byte stream: fills a prefix of the buffer and returns how many bytes were read.
//
// Zero bytes, or an EndOfFile failure, means end-of-data.
using ReadFunction = std::function<IOResult(std::span<uint8_t>)>;

// A writable byte stream: consumes a prefix of the buffer and returns how many bytes were written.
using WriteFunction = std::function<IOResult(std::span<const uint8_t>)>;

// A line-oriented text reader. Returns std::nullopt once there are no more lines.
using ReadLineFunction = std::function<std::optional<std::string>()>;

// Attempt to read data into the specified buffer using the provided reader function.
//
// It continues reading until the buffer is completely filled, the reader reaches the end of data or an error occurs.
// A premature end of data is reported as an EndOfFile failure carrying the number of bytes read so far. Exceptions
// thrown by the reader propagate to the caller.
IOResult readExact(std::span<uint8_t> buffer, const ReadFunction& reader);

// Writes all data from the buffer using a provided writer function.
//
// It continues writing until all data is successfully written or an error occurs. A writer that accepts nothing is
// reported as an EndOfFile failure.
IOResult writeAll(std::span<const uint8_t> buffer, const WriteFunction& writer);

}  // namespace utility
}  // namespace streamkit
