#include "LibMgoLog/Core/Logging.h"

#include <cstdio>
#include <iostream>
#include <vector>

#include "LibMgoLog/Core/SinkRegistry.h"

namespace libmgolog {
    namespace {
        // Loggers this thread is currently dispatching through, innermost last.
        // A sink, formatter or reporter may log into another Logger; logging
        // back into one already on the stack is dropped instead of deadlocking.
        constexpr int kMaxNesting = 8;
        thread_local const Logger* t_active[kMaxNesting];
        thread_local int t_depth = 0;

        bool IsDispatching(const Logger* logger) noexcept {
            for (int i = 0; i < t_depth; ++i) {
                if (t_active[i] == logger) return true;
            }
            return false;
        }

        struct EmitScope {
            explicit EmitScope(const Logger* logger) noexcept { t_active[t_depth++] = logger; }
            ~EmitScope() { --t_depth; }
        };

        // Exactly one trailing newline.
        void WriteConsole(std::string_view line) {
            std::cout.write(line.data(), static_cast<std::streamsize>(line.size()));
            if (line.empty() || line.back() != '\n') std::cout.put('\n');
            std::cout.flush();
            if (!std::cout) std::cout.clear();
        }
    }

    namespace detail {

        std::string VFormat(const char* format, va_list ap) {
            if (format == nullptr) return {};
            va_list probe;
            va_copy(probe, ap);
            const int n = std::vsnprintf(nullptr, 0, format, probe);
            va_end(probe);
            if (n <= 0) return {};
            std::vector<char> buf(static_cast<size_t>(n) + 1);
            std::vsnprintf(buf.data(), buf.size(), format, ap);
            return std::string(buf.data(), static_cast<size_t>(n));
        }

    } // namespace detail

    Logger::Logger(LogConfig cfg) : config_(std::move(cfg)) {}

    template <class Fn>
    void Logger::Update(Fn&& fn) noexcept {
        if (IsDispatching(this)) {
            std::fprintf(stderr, "libmgolog: configuration change from inside a log callback refused\n");
            return;
        }
        std::lock_guard<std::mutex> lk(mu_);
        try {
            LogConfig next = *config_.get();
            fn(next);
            config_.set(std::move(next));
        }
        catch (const std::exception& e) {
            ReportInternalFailure(e.what());
        }
    }

    void Logger::SetSink(std::shared_ptr<LogSink> sink) noexcept {
        Update([&](LogConfig& c) { c.sink = std::move(sink); });
    }

    void Logger::SetLoggerFunc(std::string namePrefix,
        bool crashReporting,
        Severity threshold,
        SinkFactory sinkFactory,
        Formatter formatter) noexcept
    {
        Update([&](LogConfig& c) {
            c.name_prefix = std::move(namePrefix);
            c.crash_reporting = crashReporting;
            c.threshold = threshold;
            c.sink_factory = std::move(sinkFactory);
            c.formatter = std::move(formatter);
        });
    }

    void Logger::SetDebug(bool enabled) noexcept {
        Update([&](LogConfig& c) { c.debug_enabled = enabled; });
    }

    void Logger::SetLogLevel(Severity threshold) noexcept {
        Update([&](LogConfig& c) { c.threshold = threshold; });
    }

    void Logger::SetCrashReporter(std::shared_ptr<CrashReporter> reporter) noexcept {
        Update([&](LogConfig& c) { c.crash_reporter = std::move(reporter); });
    }

    void Logger::SetLockMode(LockMode mode) noexcept {
        Update([&](LogConfig& c) { c.lock_mode = mode; });
    }

    void Logger::Configure(LogConfig cfg) noexcept {
        Update([&](LogConfig& c) { c = std::move(cfg); });
    }

    void Logger::Logf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        Vlogf(Severity::Info, format, ap);
        va_end(ap);
    }

    void Logger::Debugf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        Vlogf(Severity::Debug, format, ap);
        va_end(ap);
    }

    void Logger::Warnf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        Vlogf(Severity::Warn, format, ap);
        va_end(ap);
    }

    void Logger::Errorf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        Vlogf(Severity::Error, format, ap);
        va_end(ap);
    }

    void Logger::Vlogf(Severity level, const char* format, va_list ap) noexcept {
        Emit(level, [&] { return detail::VFormat(format, ap); });
    }

    void Logger::Write(Severity level, std::string_view content) noexcept {
        Emit(level, [&] { return std::string(content); });
    }

    void Logger::Dispatch(Severity level, std::string_view content) noexcept {
        if (t_depth >= kMaxNesting || IsDispatching(this)) return;
        EmitScope scope(this);

        auto cfg = config_.get();
        std::unique_lock<std::mutex> lk(mu_, std::defer_lock);
        if (cfg->lock_mode == LockMode::Strict) {
            lk.lock();
            cfg = config_.get();
        }

        if (!PassesLevel(*cfg, level)) return;

        if (level == Severity::Debug && !PassesDebugCap(content)) return;

        try {
            WriteLogFile(*cfg, level, content);
        }
        catch (const std::exception& e) {
            ReportInternalFailure(e.what());
        }
    }

    void Logger::WriteLogFile(const LogConfig& cfg, Severity level, std::string_view content) {
        if (!cfg.formatter) {
            WriteConsole(content);
            return;
        }

        const std::string_view arg = content;
        const std::string rendered = cfg.formatter(static_cast<int>(level), kFormatCallDepth, "%s",
            std::span<const std::string_view>(&arg, 1));

        if (level >= Severity::Error && cfg.crash_reporting && cfg.crash_reporter) {
            cfg.crash_reporter->Capture(ComposeCrashReport(cfg.name_prefix, rendered));
        }

        auto sink = ResolveSink(cfg, CategoryFor(level));
        if (!sink) {
            WriteConsole(rendered);
            return;
        }
        if (!sink->Output(kSinkCallDepth, rendered).ok()) {
            sink_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void Logger::ReportInternalFailure(const char* what) noexcept {
        std::fprintf(stderr, "libmgolog: dropped log message: %s\n", what ? what : "unknown error");
    }

    // ---- default logger ---------------------------------------------------

    Logger& DefaultLogger() noexcept {
        static Logger instance;
        return instance;
    }

    void SetLogger(std::shared_ptr<LogSink> sink) noexcept {
        DefaultLogger().SetSink(std::move(sink));
    }

    std::shared_ptr<LogSink> GetLogger() noexcept {
        return DefaultLogger().Config()->sink;
    }

    void SetLoggerFunc(std::string namePrefix,
        bool crashReporting,
        Severity threshold,
        SinkFactory sinkFactory,
        Formatter formatter) noexcept
    {
        DefaultLogger().SetLoggerFunc(std::move(namePrefix), crashReporting, threshold,
            std::move(sinkFactory), std::move(formatter));
    }

    void SetDebug(bool enabled) noexcept { DefaultLogger().SetDebug(enabled); }
    void SetLogLevel(Severity threshold) noexcept { DefaultLogger().SetLogLevel(threshold); }
    Severity GetLogLevel() noexcept { return DefaultLogger().Config()->threshold; }

    void SetCrashReporter(std::shared_ptr<CrashReporter> reporter) noexcept {
        DefaultLogger().SetCrashReporter(std::move(reporter));
    }

    void SetLockMode(LockMode mode) noexcept { DefaultLogger().SetLockMode(mode); }

    void Logf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        DefaultLogger().Vlogf(Severity::Info, format, ap);
        va_end(ap);
    }

    void Debugf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        DefaultLogger().Vlogf(Severity::Debug, format, ap);
        va_end(ap);
    }

    void Warnf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        DefaultLogger().Vlogf(Severity::Warn, format, ap);
        va_end(ap);
    }

    void Errorf(const char* format, ...) noexcept {
        va_list ap;
        va_start(ap, format);
        DefaultLogger().Vlogf(Severity::Error, format, ap);
        va_end(ap);
    }

    void Write(Severity level, std::string_view msg) noexcept {
        DefaultLogger().Write(level, msg);
    }

} // namespace libmgolog
