#include "streamkit/utility/line_reader.h"

#include <algorithm>
#include <cstring>
#include <span>
#include <utility>

namespace streamkit {
namespace utility {

namespace {

bool isLineTerminator(uint8_t c)
{
    return c == '\n' || c == '\r';
}

}  // namespace

LineReader::LineReader(ReadFunction source, size_t bufferSize)
    : _source(std::move(source)), _buffer(std::max<size_t>(bufferSize, 1)), _cursor(0), _filled(0), _exhausted(false)
{
}

std::optional<std::string> LineReader::readLine()
{
    if (_cursor == _filled && !fill()) {
        return std::nullopt;
    }

    std::string line;

    while (true) {
        if (_cursor == _filled && !fill()) {
            // Last line, without terminator
            return line;
        }

        const auto begin      = _buffer.cbegin() + _cursor;
        const auto end        = _buffer.cbegin() + _filled;
        const auto terminator = std::find_if(begin, end, isLineTerminator);

        line.append(begin, terminator);
        _cursor = static_cast<size_t>(terminator - _buffer.cbegin());

        if (terminator == end) {
            continue;
        }

        const bool carriageReturn = *terminator == '\r';
        ++_cursor;

        // "\r\n" may be split across two reads
        if (carriageReturn && (_cursor < _filled || fill()) && _buffer[_cursor] == '\n') {
            ++_cursor;
        }

        return line;
    }
}

ReadLineFunction LineReader::readLineFunction() noexcept
{
    return [this]() { return this->readLine(); };
}

bool LineReader::fill()
{
    if (_exhausted) {
        return false;
    }

    if (!_source) {
        _exhausted = true;
        _error     = Error {Error::ErrorCode::InvalidArgument, "LineReader has no source stream"};
        return false;
    }

    IOResult result = _source(_buffer);

    if (result.error) {
        _exhausted = true;

        switch (result.error.value()) {
            case IOResult::Error::EndOfFile: break;
            case IOResult::Error::WouldBlock:
                _error = Error {Error::ErrorCode::WouldBlock, "LineReader source would block"};
                break;
            case IOResult::Error::SystemError:
                _error = Error {
                    Error::ErrorCode::SystemError, "LineReader source failed:", std::strerror(result.systemErrno)};
                break;
        }
    }

    // A failed read may still carry bytes, they are handed out before the reader stops
    if (result.bytesTransferred == 0) {
        _exhausted = true;
        return false;
    }

    _cursor = 0;
    _filled = result.bytesTransferred;
    return true;
}

}  // namespace utility
}  // namespace streamkit
