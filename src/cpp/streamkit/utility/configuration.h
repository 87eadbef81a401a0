#pragma once

#include <cstddef>

namespace streamkit {
namespace utility {

constexpr size_t DEFAULT_TRANSFER_BUFFER_SIZE    = 8 * 1024;
constexpr size_t DEFAULT_LINE_READER_BUFFER_SIZE = 4 * 1024;

}  // namespace utility
}  // namespace streamkit
