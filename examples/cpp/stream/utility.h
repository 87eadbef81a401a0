#pragma once

#include <cstdlib>
#include <expected>
#include <type_traits>
#include <utility>

#include "streamkit/error/error.h"
#include "streamkit/logging/logging.h"

// Log records go to stderr, stdout carries the copied data.
inline constexpr const char* LOG_FORMAT = "%(asctime)s %(levelname)s: %(message)s";
inline constexpr const char* LOG_PATH   = "/dev/stderr";

// Simple helper that exits the program when it receives a std::unexpected value.
template <typename T>
T exitOnFailure(std::expected<T, streamkit::Error> result)
{
    if (!result.has_value()) {
        streamkit::log(streamkit::LoggingLevel::error, LOG_FORMAT, LOG_PATH, "Operation failed: ", result.error().what());
        std::exit(1);
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(result.value());
    }
}
