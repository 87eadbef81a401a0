#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace streamkit {

// Error returned by stream operations.
//
// The message is built by joining the explanation fragments with a space.
struct Error: std::exception {
    enum class ErrorCode {
        Uninit,
        InvalidArgument,
        IndexOutOfRange,
        UnexpectedEndOfStream,
        WouldBlock,
        SystemError,
    };

    template <typename... Args>
    Error(ErrorCode errorCode, Args&&... explanations)
        : _errorCode(errorCode), _message(joinExplanations(std::forward<Args>(explanations)...))
    {
        _logMsg = std::string(convertErrorToExplanation(errorCode));
        if (!_message.empty()) {
            _logMsg += ": " + _message;
        }
    }

    Error(): Error(ErrorCode::Uninit) {}

    static constexpr std::string_view convertErrorToExplanation(ErrorCode errorCode) noexcept
    {
        switch (errorCode) {
            case ErrorCode::Uninit: return "Uninitialized error";
            case ErrorCode::InvalidArgument: return "An argument is absent or has an illegal value";
            case ErrorCode::IndexOutOfRange: return "The requested window lies outside the buffer bounds";
            case ErrorCode::UnexpectedEndOfStream:
                return "The stream ended before the requested amount of data was transferred";
            case ErrorCode::WouldBlock: return "The stream is not ready and the operation would block";
            case ErrorCode::SystemError: return "A system call on the underlying stream failed";
        }
        return "Unknown error";
    }

    ErrorCode code() const noexcept { return _errorCode; }

    // The explanation fragments only, without the error code description.
    const std::string& message() const noexcept { return _message; }

    const char* what() const noexcept override { return _logMsg.c_str(); }

    ErrorCode _errorCode;
    std::string _message;
    std::string _logMsg;

private:
    template <typename... Args>
    static std::string joinExplanations(Args&&... explanations)
    {
        if constexpr (sizeof...(Args) == 0) {
            return {};
        } else {
            std::ostringstream oss;
            bool first = true;
            ((oss << (first ? "" : " ") << std::forward<Args>(explanations), first = false), ...);
            return oss.str();
        }
    }
};

}  // namespace streamkit
