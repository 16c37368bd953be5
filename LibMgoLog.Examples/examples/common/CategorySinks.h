#pragma once
#include <memory>
#include <string_view>
#include "LibMgoLog/Core/Callbacks.h"
#include "LibMgoLog/Sinks/StreamSink.h"

// Sink factory for the examples: the "error" channel goes to stderr,
// anything else to stdout.
inline libmgolog::SinkFactory MakeCategorySinks() {
    using libmgolog::sinks::ConsoleSink;
    auto out = std::make_shared<ConsoleSink>(ConsoleSink::Stream::Stdout);
    auto err = std::make_shared<ConsoleSink>(ConsoleSink::Stream::Stderr);
    return [out, err](std::string_view category) -> std::shared_ptr<libmgolog::LogSink> {
        if (category == "error") return err;
        return out;
    };
}
