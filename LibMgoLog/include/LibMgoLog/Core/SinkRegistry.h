#pragma once
#include <memory>
#include <string_view>
#include "LibMgoLog/Core/Config.h"
#include "LibMgoLog/Core/Sink.h"

namespace libmgolog {

    // Picks the destination for one call:
    //  1. the explicit sink, for every category;
    //  2. otherwise the factory's sink for a non-empty category;
    //  3. otherwise nullptr (standard output).
    // Exceptions thrown by the factory propagate to the caller.
    std::shared_ptr<LogSink> ResolveSink(const LogConfig& cfg, std::string_view category);

    // Category a severity is routed under.
    constexpr std::string_view CategoryFor(Severity s) noexcept {
        return s >= Severity::Error ? kCategoryError : kCategoryDefault;
    }

} // namespace libmgolog
