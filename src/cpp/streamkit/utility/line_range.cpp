#include "streamkit/utility/line_range.h"

#include <utility>

namespace streamkit {
namespace utility {

void LineRange::Iterator::advance()
{
    std::optional<std::string> line = _range->next();

    if (!line) {
        _range = nullptr;
        _current.clear();
        return;
    }

    _current = std::move(*line);
}

std::optional<std::string> LineRange::next()
{
    if (_exhausted) {
        return std::nullopt;
    }

    std::optional<std::string> line = _reader();
    if (!line) {
        _exhausted = true;
    }

    return line;
}

}  // namespace utility
}  // namespace streamkit
