#pragma once
#include <string_view>
#include "LibMgoLog/Core/Types.h"

namespace libmgolog {

    // Destination for rendered log lines (file, console, aggregator).
    // Output() is called with the logger's internal lock held in strict mode.
    // Logging back into the same logger is dropped; other loggers are fine.
    class LogSink {
    public:
        virtual ~LogSink() = default;

        // callDepth is the number of frames between the emitting facade call
        // and this method, for sinks that report the source location.
        // Returns IoError when the line could not be written.
        virtual Status Output(int callDepth, std::string_view message) noexcept = 0;
    };

} // namespace libmgolog
