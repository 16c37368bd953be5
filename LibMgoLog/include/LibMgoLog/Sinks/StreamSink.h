#pragma once
#include <mutex>
#include <ostream>
#include <string_view>
#include "LibMgoLog/Core/Sink.h"

namespace libmgolog::sinks {

    // Writes each line to a caller-owned std::ostream, adding the trailing
    // newline when missing. Safe for concurrent Output() calls.
    // The stream must outlive the sink.
    class OstreamSink : public LogSink {
    public:
        explicit OstreamSink(std::ostream& os) noexcept : os_(os) {}

        Status Output(int callDepth, std::string_view message) noexcept override;

    private:
        std::mutex    mu_;
        std::ostream& os_;
    };

    // OstreamSink over std::cout or std::cerr.
    class ConsoleSink final : public OstreamSink {
    public:
        enum class Stream { Stdout, Stderr };
        explicit ConsoleSink(Stream s = Stream::Stdout) noexcept;
    };

} // namespace libmgolog::sinks
