#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "streamkit/error/error.h"
#include "streamkit/utility/configuration.h"
#include "streamkit/utility/io_helpers.h"
#include "streamkit/utility/line_range.h"
#include "streamkit/utility/memory_stream.h"

namespace streamkit {
namespace utility {

// Stateless transfer helpers over caller-owned streams.
//
// Absent streams are empty std::function objects. Every argument is validated before the first read, so a rejected
// call leaves the streams untouched. None of these functions closes the streams it is given.

// Copies everything left in `source` to `destination`, using a transfer buffer of `bufferSize` bytes.
std::expected<void, Error> copyAll(
    const ReadFunction& source, const WriteFunction& destination, size_t bufferSize = DEFAULT_TRANSFER_BUFFER_SIZE);

// Copies everything left in `source` to `destination`, using `buffer` as the transfer window.
//
// The initial content of `buffer` is ignored.
std::expected<void, Error> copyAll(
    const ReadFunction& source, const WriteFunction& destination, std::span<uint8_t> buffer);

// Copies the unread content of an in-memory stream without going through a transfer buffer.
std::expected<void, Error> copyAll(MemoryStream& source, const WriteFunction& destination);

// Reads `source` up to the end of data and returns exactly the bytes read.
std::expected<std::vector<uint8_t>, Error> readAll(
    const ReadFunction& source, size_t bufferSize = DEFAULT_TRANSFER_BUFFER_SIZE);

std::expected<std::vector<uint8_t>, Error> readAll(const ReadFunction& source, std::span<uint8_t> buffer);

// Reads exactly `bytesToRead` bytes into `buffer`, starting at `startIndex`. Short reads are retried.
//
// Fails with UnexpectedEndOfStream if the source ends first; nothing is rolled back in that case. Returns `buffer`.
std::expected<std::span<uint8_t>, Error> readExactly(
    const ReadFunction& source, std::span<uint8_t> buffer, size_t startIndex, size_t bytesToRead);

// Reads exactly `bytesToRead` bytes into the beginning of `buffer`.
std::expected<std::span<uint8_t>, Error> readExactly(
    const ReadFunction& source, std::span<uint8_t> buffer, size_t bytesToRead);

// Fills the whole of `buffer`.
std::expected<std::span<uint8_t>, Error> readExactly(const ReadFunction& source, std::span<uint8_t> buffer);

// Reads exactly `bytesToRead` bytes into a new buffer of that size.
std::expected<std::vector<uint8_t>, Error> readExactly(const ReadFunction& source, size_t bytesToRead);

// Lazily iterates over the lines produced by `reader`.
std::expected<LineRange, Error> lines(ReadLineFunction reader);

}  // namespace utility
}  // namespace streamkit
