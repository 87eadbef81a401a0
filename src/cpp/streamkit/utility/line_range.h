#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "streamkit/utility/io_helpers.h"

namespace streamkit {
namespace utility {

// A lazy, single-pass sequence of the lines produced by a ReadLineFunction.
//
// Advancing consumes the underlying reader. Once the reader returns std::nullopt it is never called again.
class LineRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = std::string;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const std::string*;
        using reference         = const std::string&;

        // The end iterator
        Iterator() noexcept = default;

        explicit Iterator(LineRange* range): _range(range) { advance(); }

        reference operator*() const noexcept { return _current; }
        pointer operator->() const noexcept { return &_current; }

        Iterator& operator++()
        {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        friend bool operator==(const Iterator& lhs, const Iterator& rhs) noexcept { return lhs._range == rhs._range; }

    private:
        LineRange* _range {nullptr};
        std::string _current;

        void advance();
    };

    explicit LineRange(ReadLineFunction reader) noexcept: _reader(std::move(reader)), _exhausted(false) {}

    LineRange(LineRange&&) noexcept            = default;
    LineRange& operator=(LineRange&&) noexcept = default;

    LineRange(const LineRange&)            = delete;
    LineRange& operator=(const LineRange&) = delete;

    // Pull the next line, std::nullopt once the reader is exhausted.
    std::optional<std::string> next();

    bool exhausted() const noexcept { return _exhausted; }

    // Iteration resumes where the previous one stopped.
    Iterator begin() { return Iterator(this); }
    Iterator end() noexcept { return Iterator(); }

private:
    ReadLineFunction _reader;
    bool _exhausted;
};

}  // namespace utility
}  // namespace streamkit
