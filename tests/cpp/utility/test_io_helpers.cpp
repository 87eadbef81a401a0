#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "streamkit/utility/io_helpers.h"

using namespace streamkit::utility;

class IOHelpersTest: public ::testing::Test {
protected:
    // One scripted step: hand out `data`, then report `error` (if any) in the same result.
    struct Step {
        std::string data;
        std::optional<IOResult::Error> error = std::nullopt;
        int systemErrno                      = 0;
    };

    // Plays the steps in order. Once they run out, every call reports success(0).
    ReadFunction scriptedReader(std::vector<Step> steps)
    {
        _steps = std::move(steps);
        _next  = 0;

        return [this](std::span<uint8_t> buffer) {
            ++_calls;
            if (_next == _steps.size()) {
                return IOResult::success(0);
            }

            const Step& step = _steps[_next++];
            EXPECT_LE(step.data.size(), buffer.size());
            std::copy(step.data.begin(), step.data.end(), buffer.begin());

            if (step.error) {
                return IOResult::failure(*step.error, step.data.size(), step.systemErrno);
            }
            return IOResult::success(step.data.size());
        };
    }

    std::vector<Step> _steps;
    size_t _next  = 0;
    size_t _calls = 0;
};

TEST_F(IOHelpersTest, ReadExactGathersShortReads)
{
    ReadFunction reader = scriptedReader({{"ab"}, {"c"}, {"def"}});

    std::vector<uint8_t> buffer(6);
    IOResult res = readExact(buffer, reader);

    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.bytesTransferred, 6);
    EXPECT_EQ(std::string(buffer.begin(), buffer.end()), "abcdef");
    EXPECT_EQ(_calls, 3);
}

TEST_F(IOHelpersTest, ReadExactTreatsZeroLengthReadAsEndOfData)
{
    ReadFunction reader = scriptedReader({{"xy"}});

    std::vector<uint8_t> buffer(4);
    IOResult res = readExact(buffer, reader);

    EXPECT_EQ(res.error, IOResult::Error::EndOfFile);
    EXPECT_EQ(res.bytesTransferred, 2);
    EXPECT_EQ(_calls, 2);
}

TEST_F(IOHelpersTest, ReadExactKeepsBytesDeliveredWithFailure)
{
    ReadFunction reader = scriptedReader({{"a"}, {"bc", IOResult::Error::SystemError, EIO}});

    std::vector<uint8_t> buffer(8);
    IOResult res = readExact(buffer, reader);

    EXPECT_EQ(res.error, IOResult::Error::SystemError);
    EXPECT_EQ(res.systemErrno, EIO);
    EXPECT_EQ(res.bytesTransferred, 3);
    EXPECT_EQ(std::string(buffer.begin(), buffer.begin() + 3), "abc");
}

TEST_F(IOHelpersTest, ReadExactStopsOnWouldBlock)
{
    ReadFunction reader = scriptedReader({{"", IOResult::Error::WouldBlock}, {"never read"}});

    std::vector<uint8_t> buffer(4);
    IOResult res = readExact(buffer, reader);

    EXPECT_EQ(res.error, IOResult::Error::WouldBlock);
    EXPECT_EQ(res.bytesTransferred, 0);
    EXPECT_EQ(_calls, 1);
}

TEST_F(IOHelpersTest, ReadExactPropagatesReaderExceptions)
{
    ReadFunction reader = [](std::span<uint8_t>) -> IOResult { throw std::runtime_error("device unplugged"); };

    std::vector<uint8_t> buffer(4);
    EXPECT_THROW(readExact(buffer, reader), std::runtime_error);
}

TEST_F(IOHelpersTest, WriteAllRetriesUntilEverythingIsAccepted)
{
    std::string written;
    WriteFunction writer = [&](std::span<const uint8_t> buffer) {
        // Accepts at most three bytes per call
        const size_t n = std::min<size_t>(buffer.size(), 3);
        written.append(buffer.begin(), buffer.begin() + n);
        return IOResult::success(n);
    };

    const std::string message = "a longer message";
    IOResult res = writeAll(std::span(reinterpret_cast<const uint8_t*>(message.data()), message.size()), writer);

    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.bytesTransferred, message.size());
    EXPECT_EQ(written, message);
}

TEST_F(IOHelpersTest, WriteAllReportsRefusingWriter)
{
    size_t nCalls        = 0;
    WriteFunction writer = [&](std::span<const uint8_t> buffer) {
        // Takes the first two bytes, then nothing
        ++nCalls;
        return IOResult::success(nCalls == 1 ? std::min<size_t>(buffer.size(), 2) : 0);
    };

    std::vector<uint8_t> buffer(5, 'z');
    IOResult res = writeAll(buffer, writer);

    EXPECT_EQ(res.error, IOResult::Error::EndOfFile);
    EXPECT_EQ(res.bytesTransferred, 2);
    EXPECT_EQ(nCalls, 2);
}

TEST_F(IOHelpersTest, WriteAllForwardsSystemErrno)
{
    WriteFunction writer = [](std::span<const uint8_t>) {
        return IOResult::failure(IOResult::Error::SystemError, 0, EPIPE);
    };

    std::vector<uint8_t> buffer(3);
    IOResult res = writeAll(buffer, writer);

    EXPECT_EQ(res.error, IOResult::Error::SystemError);
    EXPECT_EQ(res.systemErrno, EPIPE);
    EXPECT_EQ(res.bytesTransferred, 0);
}

TEST_F(IOHelpersTest, WriteAllEmptyBuffer)
{
    WriteFunction writer = [](std::span<const uint8_t>) -> IOResult {
        ADD_FAILURE() << "writer must not be called";
        return IOResult::success(0);
    };

    IOResult res = writeAll(std::span<const uint8_t>(), writer);
    EXPECT_FALSE(res.error);
    EXPECT_EQ(res.bytesTransferred, 0);
}
