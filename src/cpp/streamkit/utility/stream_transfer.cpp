#include "streamkit/utility/stream_transfer.h"

#include <cstring>
#include <string>
#include <utility>

namespace streamkit {
namespace utility {

namespace {

using ErrorCode = Error::ErrorCode;

std::string pluralizeBytes(size_t count)
{
    return std::to_string(count) + (count == 1 ? " byte" : " bytes");
}

Error readFailure(const IOResult& result, size_t remaining)
{
    switch (result.error.value_or(IOResult::Error::EndOfFile)) {
        case IOResult::Error::WouldBlock:
            return {ErrorCode::WouldBlock, "Source would block with", pluralizeBytes(remaining), "left to read."};
        case IOResult::Error::SystemError:
            return {
                ErrorCode::SystemError,
                "Source failed with",
                pluralizeBytes(remaining),
                "left to read:",
                std::strerror(result.systemErrno)};
        case IOResult::Error::EndOfFile: break;
    }

    return {ErrorCode::UnexpectedEndOfStream, "End of stream reached with", pluralizeBytes(remaining), "left to read."};
}

Error writeFailure(const IOResult& result, size_t remaining)
{
    switch (result.error.value_or(IOResult::Error::EndOfFile)) {
        case IOResult::Error::WouldBlock:
            return {ErrorCode::WouldBlock, "Destination would block with", pluralizeBytes(remaining), "left to write."};
        case IOResult::Error::SystemError:
            return {
                ErrorCode::SystemError,
                "Destination failed with",
                pluralizeBytes(remaining),
                "left to write:",
                std::strerror(result.systemErrno)};
        case IOResult::Error::EndOfFile: break;
    }

    return {
        ErrorCode::UnexpectedEndOfStream,
        "Destination stopped accepting data with",
        pluralizeBytes(remaining),
        "left to write."};
}

std::expected<void, Error> validateTransfer(const ReadFunction& source, std::span<uint8_t> buffer)
{
    if (!source) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "source stream is absent"});
    }

    if (buffer.empty()) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "transfer buffer has length of 0"});
    }

    return {};
}

// Arguments are already validated. Bytes delivered together with a failure are written before the
// failure is acted on.
std::expected<void, Error> transfer(
    const ReadFunction& source, const WriteFunction& destination, std::span<uint8_t> buffer)
{
    while (true) {
        IOResult readResult = source(buffer);

        if (readResult.bytesTransferred > 0) {
            std::span<const uint8_t> chunk = buffer.first(readResult.bytesTransferred);

            IOResult writeResult = writeAll(chunk, destination);
            if (writeResult.error) {
                return std::unexpected(writeFailure(writeResult, chunk.size() - writeResult.bytesTransferred));
            }
        }

        if (!readResult.error) {
            if (readResult.bytesTransferred == 0) {
                return {};
            }
            continue;
        }

        switch (readResult.error.value()) {
            case IOResult::Error::EndOfFile: return {};
            case IOResult::Error::WouldBlock:
                return std::unexpected(Error {ErrorCode::WouldBlock, "Source would block"});
            case IOResult::Error::SystemError:
                return std::unexpected(
                    Error {ErrorCode::SystemError, "Source failed:", std::strerror(readResult.systemErrno)});
        }
    }
}

}  // namespace

std::expected<void, Error> copyAll(const ReadFunction& source, const WriteFunction& destination, size_t bufferSize)
{
    if (bufferSize < 1) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "bufferSize must be at least 1"});
    }

    if (!source || !destination) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "source or destination stream is absent"});
    }

    std::vector<uint8_t> buffer(bufferSize);
    return copyAll(source, destination, buffer);
}

std::expected<void, Error> copyAll(
    const ReadFunction& source, const WriteFunction& destination, std::span<uint8_t> buffer)
{
    if (auto valid = validateTransfer(source, buffer); !valid) {
        return valid;
    }

    if (!destination) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "destination stream is absent"});
    }

    return transfer(source, destination, buffer);
}

std::expected<void, Error> copyAll(MemoryStream& source, const WriteFunction& destination)
{
    if (!destination) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "destination stream is absent"});
    }

    const size_t toWrite = source.remaining();

    IOResult result = source.writeTo(destination);
    if (result.error) {
        return std::unexpected(writeFailure(result, toWrite - result.bytesTransferred));
    }

    return {};
}

std::expected<std::vector<uint8_t>, Error> readAll(const ReadFunction& source, size_t bufferSize)
{
    if (bufferSize < 1) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "bufferSize must be at least 1"});
    }

    if (!source) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "source stream is absent"});
    }

    std::vector<uint8_t> buffer(bufferSize);
    return readAll(source, buffer);
}

std::expected<std::vector<uint8_t>, Error> readAll(const ReadFunction& source, std::span<uint8_t> buffer)
{
    if (auto valid = validateTransfer(source, buffer); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    MemoryStream accumulator;

    if (auto copied = transfer(source, accumulator.writeFunction(), buffer); !copied) {
        return std::unexpected(std::move(copied.error()));
    }

    return accumulator.release();
}

std::expected<std::span<uint8_t>, Error> readExactly(
    const ReadFunction& source, std::span<uint8_t> buffer, size_t startIndex, size_t bytesToRead)
{
    if (!source) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "source stream is absent"});
    }

    if (buffer.empty()) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "buffer has length of 0"});
    }

    if (startIndex >= buffer.size()) {
        return std::unexpected(
            Error {ErrorCode::IndexOutOfRange, "startIndex", startIndex, "for a buffer of", pluralizeBytes(buffer.size())});
    }

    if (bytesToRead < 1 || bytesToRead > buffer.size() - startIndex) {
        return std::unexpected(Error {
            ErrorCode::IndexOutOfRange,
            "bytesToRead",
            bytesToRead,
            "from startIndex",
            startIndex,
            "for a buffer of",
            pluralizeBytes(buffer.size())});
    }

    IOResult result = readExact(buffer.subspan(startIndex, bytesToRead), source);
    if (result.error) {
        return std::unexpected(readFailure(result, bytesToRead - result.bytesTransferred));
    }

    return buffer;
}

std::expected<std::span<uint8_t>, Error> readExactly(
    const ReadFunction& source, std::span<uint8_t> buffer, size_t bytesToRead)
{
    return readExactly(source, buffer, 0, bytesToRead);
}

std::expected<std::span<uint8_t>, Error> readExactly(const ReadFunction& source, std::span<uint8_t> buffer)
{
    return readExactly(source, buffer, 0, buffer.size());
}

std::expected<std::vector<uint8_t>, Error> readExactly(const ReadFunction& source, size_t bytesToRead)
{
    if (bytesToRead < 1) {
        return std::unexpected(Error {ErrorCode::IndexOutOfRange, "bytesToRead must be at least 1"});
    }

    std::vector<uint8_t> buffer(bytesToRead);

    if (auto read = readExactly(source, std::span<uint8_t>(buffer), 0, bytesToRead); !read) {
        return std::unexpected(std::move(read.error()));
    }

    return buffer;
}

std::expected<LineRange, Error> lines(ReadLineFunction reader)
{
    if (!reader) {
        return std::unexpected(Error {ErrorCode::InvalidArgument, "line reader is absent"});
    }

    return LineRange(std::move(reader));
}

}  // namespace utility
}  // namespace streamkit
