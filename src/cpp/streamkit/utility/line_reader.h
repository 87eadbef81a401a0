#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "streamkit/error/error.h"
#include "streamkit/utility/configuration.h"
#include "streamkit/utility/io_helpers.h"

namespace streamkit {
namespace utility {

// Reads text lines from a byte stream.
//
// A line ends with "\n", "\r\n" or "\r"; the terminator is not part of the returned line. A terminator at the very end
// of the stream does not produce an extra empty line. The bytes are returned as they are, no decoding is applied.
class LineReader {
public:
    explicit LineReader(ReadFunction source, size_t bufferSize = DEFAULT_LINE_READER_BUFFER_SIZE);

    LineReader(LineReader&&) noexcept            = default;
    LineReader& operator=(LineReader&&) noexcept = default;

    LineReader(const LineReader&)            = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Returns the next line, or std::nullopt at the end of the stream.
    //
    // Reading also stops when the source fails, in which case error() holds the failure.
    std::optional<std::string> readLine();

    // The failure that stopped the reader, if any.
    const std::optional<Error>& error() const noexcept { return _error; }

    // The reader must outlive the returned function.
    ReadLineFunction readLineFunction() noexcept;

private:
    ReadFunction _source;
    std::vector<uint8_t> _buffer;
    size_t _cursor;
    size_t _filled;
    bool _exhausted;
    std::optional<Error> _error;

    // Refills the buffer from the source. Returns false once the source has nothing more to give.
    bool fill();
};

}  // namespace utility
}  // namespace streamkit
