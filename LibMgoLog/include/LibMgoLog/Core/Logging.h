#pragma once
/**
 * @file Logging.h
 * @brief Level-filtered logging facade used by the driver.
 *
 * A Logger owns one configuration snapshot and exposes the emitters
 * (Log/Debug/Warn/Error, each in plain, "ln" and printf flavours). The free
 * functions at the bottom of this file act on the process-wide default
 * logger; configure it once at startup, before concurrent use.
 */

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>

#include "LibMgoLog/Core/Types.h"
#include "LibMgoLog/Core/Callbacks.h"
#include "LibMgoLog/Core/Config.h"
#include "LibMgoLog/Core/LevelGate.h"
#include "LibMgoLog/Core/Sink.h"
#include "LibMgoLog/Core/CrashReporter.h"

#if defined(__GNUC__) || defined(__clang__)
#define LIBMGOLOG_PRINTF_FMT(fmtIdx, argIdx) __attribute__((format(printf, fmtIdx, argIdx)))
#else
#define LIBMGOLOG_PRINTF_FMT(fmtIdx, argIdx)
#endif

namespace libmgolog {

    namespace detail {

        template <class T>
        inline constexpr bool is_string_like_v = std::is_convertible_v<const T&, std::string_view>;

        // Operands back to back; a space goes between two adjacent operands
        // when neither of them is a string.
        template <class... Args>
        std::string Concat(const Args&... args) {
            std::ostringstream os;
            os << std::boolalpha;
            bool first = true;
            bool prevString = false;
            auto put = [&](const auto& a) {
                constexpr bool isString = is_string_like_v<std::decay_t<decltype(a)>>;
                if (!first && !isString && !prevString) os << ' ';
                os << a;
                first = false;
                prevString = isString;
            };
            (put(args), ...);
            return os.str();
        }

        // Every operand separated by a space, newline appended.
        template <class... Args>
        std::string ConcatLine(const Args&... args) {
            std::ostringstream os;
            os << std::boolalpha;
            bool first = true;
            auto put = [&](const auto& a) {
                if (!first) os << ' ';
                os << a;
                first = false;
            };
            (put(args), ...);
            os << '\n';
            return os.str();
        }

        std::string VFormat(const char* format, va_list ap);

    } // namespace detail

    class Logger {
    public:
        explicit Logger(LogConfig cfg = {});

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        // ---- configuration ------------------------------------------------
        // Setters called from this logger's own sink, formatter or crash
        // reporter are refused with a note on stderr.

        // Fixed sink for every category; nullptr restores category routing.
        void SetSink(std::shared_ptr<LogSink> sink) noexcept;

        void SetLoggerFunc(std::string namePrefix,
            bool crashReporting,
            Severity threshold,
            SinkFactory sinkFactory,
            Formatter formatter) noexcept;

        void SetDebug(bool enabled) noexcept;
        void SetLogLevel(Severity threshold) noexcept;
        void SetCrashReporter(std::shared_ptr<CrashReporter> reporter) noexcept;
        void SetLockMode(LockMode mode) noexcept;

        // Replace the whole configuration.
        void Configure(LogConfig cfg) noexcept;

        std::shared_ptr<const LogConfig> Config() const noexcept { return config_.get(); }

        // ---- emitters -----------------------------------------------------

        template <class... Args>
        void Log(const Args&... args) noexcept { Emit(Severity::Info, [&] { return detail::Concat(args...); }); }

        template <class... Args>
        void Logln(const Args&... args) noexcept { Emit(Severity::Info, [&] { return detail::ConcatLine(args...); }); }

        LIBMGOLOG_PRINTF_FMT(2, 3)
        void Logf(const char* format, ...) noexcept;

        template <class... Args>
        void Debug(const Args&... args) noexcept { Emit(Severity::Debug, [&] { return detail::Concat(args...); }); }

        template <class... Args>
        void Debugln(const Args&... args) noexcept { Emit(Severity::Debug, [&] { return detail::ConcatLine(args...); }); }

        LIBMGOLOG_PRINTF_FMT(2, 3)
        void Debugf(const char* format, ...) noexcept;

        template <class... Args>
        void Warn(const Args&... args) noexcept { Emit(Severity::Warn, [&] { return detail::Concat(args...); }); }

        template <class... Args>
        void Warnln(const Args&... args) noexcept { Emit(Severity::Warn, [&] { return detail::ConcatLine(args...); }); }

        LIBMGOLOG_PRINTF_FMT(2, 3)
        void Warnf(const char* format, ...) noexcept;

        template <class... Args>
        void Error(const Args&... args) noexcept { Emit(Severity::Error, [&] { return detail::Concat(args...); }); }

        template <class... Args>
        void Errorln(const Args&... args) noexcept { Emit(Severity::Error, [&] { return detail::ConcatLine(args...); }); }

        LIBMGOLOG_PRINTF_FMT(2, 3)
        void Errorf(const char* format, ...) noexcept;

        // printf-style emission at an explicit level.
        void Vlogf(Severity level, const char* format, va_list ap) noexcept;

        // Emit already built content at an explicit level.
        void Write(Severity level, std::string_view content) noexcept;

        // Number of LogSink::Output calls that returned an error.
        std::uint64_t SinkFailures() const noexcept { return sink_failures_.load(std::memory_order_relaxed); }

    private:
        template <class Render>
        void Emit(Severity level, Render&& render) noexcept {
            // Early out before rendering; Dispatch checks again on the snapshot it writes with.
            if (!PassesLevel(*config_.get(), level)) return;
            try {
                Dispatch(level, render());
            }
            catch (const std::exception& e) {
                ReportInternalFailure(e.what());
            }
        }

        // Shared write path: lock, level and debug cap, render, forward, write.
        void Dispatch(Severity level, std::string_view content) noexcept;
        void WriteLogFile(const LogConfig& cfg, Severity level, std::string_view content);
        void ReportInternalFailure(const char* what) noexcept;

        template <class Fn>
        void Update(Fn&& fn) noexcept;

        RcuCell<LogConfig>          config_;
        std::mutex                  mu_;
        std::atomic<std::uint64_t>  sink_failures_{ 0 };
    };

    // Process-wide default logger.
    Logger& DefaultLogger() noexcept;

    // ---- configuration of the default logger ------------------------------
    void SetLogger(std::shared_ptr<LogSink> sink) noexcept;
    std::shared_ptr<LogSink> GetLogger() noexcept;
    void SetLoggerFunc(std::string namePrefix,
        bool crashReporting,
        Severity threshold,
        SinkFactory sinkFactory,
        Formatter formatter) noexcept;
    void SetDebug(bool enabled) noexcept;
    void SetLogLevel(Severity threshold) noexcept;
    Severity GetLogLevel() noexcept;
    void SetCrashReporter(std::shared_ptr<CrashReporter> reporter) noexcept;
    void SetLockMode(LockMode mode) noexcept;

    // ---- emitters on the default logger -----------------------------------
    template <class... Args> void Log(const Args&... args) noexcept { DefaultLogger().Log(args...); }
    template <class... Args> void Logln(const Args&... args) noexcept { DefaultLogger().Logln(args...); }
    LIBMGOLOG_PRINTF_FMT(1, 2)
    void Logf(const char* format, ...) noexcept;

    template <class... Args> void Debug(const Args&... args) noexcept { DefaultLogger().Debug(args...); }
    template <class... Args> void Debugln(const Args&... args) noexcept { DefaultLogger().Debugln(args...); }
    LIBMGOLOG_PRINTF_FMT(1, 2)
    void Debugf(const char* format, ...) noexcept;

    template <class... Args> void Warn(const Args&... args) noexcept { DefaultLogger().Warn(args...); }
    template <class... Args> void Warnln(const Args&... args) noexcept { DefaultLogger().Warnln(args...); }
    LIBMGOLOG_PRINTF_FMT(1, 2)
    void Warnf(const char* format, ...) noexcept;

    template <class... Args> void Error(const Args&... args) noexcept { DefaultLogger().Error(args...); }
    template <class... Args> void Errorln(const Args&... args) noexcept { DefaultLogger().Errorln(args...); }
    LIBMGOLOG_PRINTF_FMT(1, 2)
    void Errorf(const char* format, ...) noexcept;

    // Lightweight helper for the library's own diagnostics.
    void Write(Severity level, std::string_view msg) noexcept;

} // namespace libmgolog

#define LIBMGOLOG_LOG(lvl, msg) ::libmgolog::Write((lvl), (msg))
