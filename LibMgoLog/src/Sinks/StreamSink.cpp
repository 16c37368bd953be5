#include "LibMgoLog/Sinks/StreamSink.h"

#include <iostream>

namespace libmgolog::sinks {

    Status OstreamSink::Output(int /*callDepth*/, std::string_view message) noexcept {
        std::lock_guard<std::mutex> lk(mu_);
        try {
            os_.write(message.data(), static_cast<std::streamsize>(message.size()));
            if (message.empty() || message.back() != '\n') os_.put('\n');
            os_.flush();
        }
        catch (const std::ios_base::failure&) {
            // stream has exceptions() enabled; fall through to the state check
        }
        if (!os_) {
            os_.clear();
            return Status{ ResultCode::IoError };
        }
        return Status{ ResultCode::Ok };
    }

    ConsoleSink::ConsoleSink(Stream s) noexcept
        : OstreamSink(s == Stream::Stderr ? std::cerr : std::cout) {
    }

} // namespace libmgolog::sinks
