#include <gtest/gtest.h>

#include <cstddef>
#include <exception>
#include <string>

#include "streamkit/error/error.h"

using namespace streamkit;

class ErrorTest: public ::testing::Test {};

TEST_F(ErrorTest, JoinsExplanations)
{
    const size_t remaining = 3;
    Error error {Error::ErrorCode::UnexpectedEndOfStream, "End of stream reached with", remaining, "bytes"};

    ASSERT_EQ(error.code(), Error::ErrorCode::UnexpectedEndOfStream);
    ASSERT_EQ(error.message(), "End of stream reached with 3 bytes");
    ASSERT_EQ(
        std::string(error.what()),
        std::string(Error::convertErrorToExplanation(Error::ErrorCode::UnexpectedEndOfStream)) +
            ": End of stream reached with 3 bytes");
}

TEST_F(ErrorTest, WithoutExplanation)
{
    Error error {Error::ErrorCode::InvalidArgument};

    ASSERT_TRUE(error.message().empty());
    ASSERT_EQ(std::string(error.what()), Error::convertErrorToExplanation(Error::ErrorCode::InvalidArgument));
}

TEST_F(ErrorTest, DefaultIsUninit)
{
    Error error;
    ASSERT_EQ(error._errorCode, Error::ErrorCode::Uninit);
}

TEST_F(ErrorTest, CanBeThrown)
{
    try {
        throw Error {Error::ErrorCode::SystemError, "read(2) failed:", "Is a directory"};
    } catch (const std::exception& e) {
        ASSERT_NE(std::string(e.what()).find("read(2) failed: Is a directory"), std::string::npos);
        return;
    }
    FAIL() << "expected an exception";
}
