// Copies stdin to stdout, or prints the number of lines read from stdin with --lines.
//
// The log level is read from the STREAMKIT_LOG_LEVEL environment variable (CRITICAL, ERROR, WARNING, INFO, DEBUG).

#include <unistd.h>

#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <string_view>

#include "streamkit/logging/logging.h"
#include "streamkit/utility/fd_stream.h"
#include "streamkit/utility/line_reader.h"
#include "streamkit/utility/stream_transfer.h"
#include "utility.h"

using namespace streamkit;
using namespace streamkit::utility;

int main(int argc, char** argv)
{
    if (const char* level = std::getenv("STREAMKIT_LOG_LEVEL")) {
        LOGGING_LEVEL = stringToLogLevel(level);
    }

    const bool countLines = argc > 1 && std::string_view(argv[1]) == "--lines";

    ReadFunction input   = fileDescriptorReader(STDIN_FILENO);
    WriteFunction output = fileDescriptorWriter(STDOUT_FILENO);

    if (countLines) {
        LineReader reader(input);
        LineRange range = exitOnFailure(lines(reader.readLineFunction()));

        size_t nLines = 0;
        for ([[maybe_unused]] const std::string& line: range) {
            ++nLines;
        }

        if (reader.error()) {
            log(LoggingLevel::error, LOG_FORMAT, LOG_PATH, "Reading lines failed: ", reader.error()->what());
            return 1;
        }

        std::cout << nLines << std::endl;
    } else {
        size_t nBytes             = 0;
        WriteFunction destination = [&](std::span<const uint8_t> buffer) {
            IOResult result = output(buffer);
            nBytes += result.bytesTransferred;
            return result;
        };

        exitOnFailure(copyAll(input, destination));
        log(LoggingLevel::info, LOG_FORMAT, LOG_PATH, "Copied ", nBytes, " bytes");
    }

    return 0;
}
