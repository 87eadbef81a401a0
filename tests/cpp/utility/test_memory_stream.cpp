#include <gtest/gtest.h>

#include <array>
#include <span>
#include <vector>

#include "streamkit/utility/memory_stream.h"

using namespace streamkit::utility;

class MemoryStreamTest: public ::testing::Test {};

TEST_F(MemoryStreamTest, ReadsWhatWasWritten)
{
    MemoryStream stream;

    constexpr std::array<uint8_t, 4> first  = {1, 2, 3, 4};
    constexpr std::array<uint8_t, 2> second = {5, 6};

    ASSERT_EQ(stream.write(first).bytesTransferred, first.size());
    ASSERT_EQ(stream.write(second).bytesTransferred, second.size());
    ASSERT_EQ(stream.size(), 6);

    std::array<uint8_t, 4> buffer {};

    IOResult result = stream.read(buffer);
    ASSERT_FALSE(result.error);
    ASSERT_EQ(result.bytesTransferred, 4);
    ASSERT_EQ(buffer, first);

    // Short read at the end of the data
    result = stream.read(buffer);
    ASSERT_FALSE(result.error);
    ASSERT_EQ(result.bytesTransferred, 2);
    ASSERT_EQ(buffer[0], 5);
    ASSERT_EQ(buffer[1], 6);

    result = stream.read(buffer);
    ASSERT_EQ(result.error, IOResult::Error::EndOfFile);
    ASSERT_EQ(result.bytesTransferred, 0);
}

TEST_F(MemoryStreamTest, WriteToHandsOverUnreadBytes)
{
    MemoryStream source(std::vector<uint8_t> {'a', 'b', 'c', 'd'});

    std::array<uint8_t, 1> skipped {};
    ASSERT_EQ(source.read(skipped).bytesTransferred, 1);

    MemoryStream destination(std::vector<uint8_t> {'x'});

    IOResult result = source.writeTo(destination.writeFunction());
    ASSERT_FALSE(result.error);
    ASSERT_EQ(result.bytesTransferred, 3);
    ASSERT_EQ(source.remaining(), 0);

    ASSERT_EQ(destination.buffer(), (std::vector<uint8_t> {'x', 'b', 'c', 'd'}));
}

TEST_F(MemoryStreamTest, RewindAndRelease)
{
    MemoryStream stream(std::vector<uint8_t> {7, 8, 9});

    std::array<uint8_t, 3> buffer {};
    ASSERT_EQ(stream.read(buffer).bytesTransferred, 3);
    ASSERT_EQ(stream.position(), 3);

    stream.rewind();
    ASSERT_EQ(stream.remaining(), 3);

    std::vector<uint8_t> released = stream.release();
    ASSERT_EQ(released, (std::vector<uint8_t> {7, 8, 9}));
    ASSERT_EQ(stream.size(), 0);
    ASSERT_EQ(stream.position(), 0);
}
