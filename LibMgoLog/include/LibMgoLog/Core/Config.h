#pragma once
/**
 * @file Config.h
 * @brief Logger configuration snapshot and facade constants.
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include "LibMgoLog/Core/Types.h"
#include "LibMgoLog/Core/Callbacks.h"

namespace libmgolog {

    class LogSink;
    class CrashReporter;

    /// Debug messages longer than this many code points are dropped.
    inline constexpr std::size_t kMaxDebugOutput = 256;

    /// Call depth handed to the formatter (facade nesting above it).
    inline constexpr int kFormatCallDepth = 4;

    /// Call depth handed to LogSink::Output.
    inline constexpr int kSinkCallDepth = 2;

    /// Categories used to pick a sink from the factory.
    inline constexpr std::string_view kCategoryDefault = "";
    inline constexpr std::string_view kCategoryError = "error";

    /**
     * @brief How emissions are serialized.
     *
     *  - Strict: every emission and every setter holds the logger mutex, so
     *    sinks, formatters and reporters are never called concurrently.
     *  - Fast: emissions read the configuration snapshot without the mutex.
     *    Meant for processes that configure once at startup; sinks must then
     *    tolerate concurrent Output() calls.
     */
    enum class LockMode { Strict, Fast };

    /**
     * @brief Everything an emission reads.
     *
     * Published as an immutable snapshot; setters copy, modify and republish.
     */
    struct LogConfig {
        Severity                        threshold{ Severity::Debug };
        bool                            debug_enabled{ true };
        std::string                     name_prefix;      // prepended to crash reports
        bool                            crash_reporting{ false };
        std::shared_ptr<LogSink>        sink;             // overrides sink_factory
        SinkFactory                     sink_factory;
        Formatter                       formatter;
        std::shared_ptr<CrashReporter>  crash_reporter;
        LockMode                        lock_mode{ LockMode::Strict };
    };

} // namespace libmgolog
