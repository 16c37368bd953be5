// LibMgoLog.Tests/Logging.Tests.cpp
// Emitter behaviour: gating, rendering, sink routing and the console fallback.

#include <catch2/catch.hpp>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "common/Probes.h"

using namespace libmgolog;
using testutil::CoutCapture;
using testutil::ProbeSink;
using testutil::StderrCapture;
using testutil::TaggingFormatter;

// ============================================================================
// CONSOLE FALLBACK
// ============================================================================
TEST_CASE("Unconfigured logger prints to stdout with one trailing newline", "[logging][console]") {
    Logger logger;
    CoutCapture out;

    SECTION("Log") {
        logger.Log("hello");
        REQUIRE(out.str() == "hello\n");
    }
    SECTION("Logln already ends in a newline") {
        logger.Logln("a", 1);
        REQUIRE(out.str() == "a 1\n");
    }
    SECTION("Logf") {
        logger.Logf("%d-%s", 7, "x");
        REQUIRE(out.str() == "7-x\n");
    }
    SECTION("Errorf") {
        logger.Errorf("code=%d\n", 11000);
        REQUIRE(out.str() == "code=11000\n");
    }
}

TEST_CASE("Plain emitters space only non-string neighbours", "[logging][console]") {
    Logger logger;
    CoutCapture out;

    logger.Log("a", 1, 2, "b", true);
    logger.Logln("a", 1, 2, "b", true);
    REQUIRE(out.str() == "a1 2btrue\na 1 2 b true\n");
}

TEST_CASE("Sink without a formatter degrades to stdout", "[logging][console]") {
    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetSink(sink);

    CoutCapture out;
    logger.Log("raw");
    REQUIRE(out.str() == "raw\n");
    REQUIRE(sink->Count() == 0);
}

// ============================================================================
// LEVEL GATE
// ============================================================================
TEST_CASE("Threshold info suppresses debug only", "[logging][level]") {
    Logger logger;
    logger.SetLogLevel(Severity::Info);
    CoutCapture out;

    logger.Debug("x");
    logger.Debugln("x");
    logger.Debugf("%s", "x");
    REQUIRE(out.str().empty());

    logger.Log("hello");
    REQUIRE(out.str() == "hello\n");
}

TEST_CASE("Threshold warn suppresses info but not warn", "[logging][level]") {
    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Warn, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    logger.Log("info");
    logger.Logln("info");
    logger.Logf("info");
    REQUIRE(sink->Count() == 0);

    logger.Warn("warn");
    logger.Warnln("warn");
    logger.Warnf("%s", "warn");
    REQUIRE(sink->Count() == 3);
    REQUIRE(sink->lines[0] == "2|warn");
    REQUIRE(sink->lines[1] == "2|warn\n");
}

TEST_CASE("Error emitters ignore the threshold", "[logging][level]") {
    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Fatal, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    logger.Warn("hidden");
    logger.Error("e1");
    logger.Errorln("e2");
    logger.Errorf("e%d", 3);

    REQUIRE(sink->lines == std::vector<std::string>{ "3|e1", "3|e2\n", "3|e3" });
}

TEST_CASE("SetDebug(false) silences debug emitters", "[logging][level]") {
    Logger logger;
    logger.SetDebug(false);
    CoutCapture out;

    logger.Debug("x");
    REQUIRE(out.str().empty());

    logger.SetDebug(true);
    logger.Debug("x");
    REQUIRE(out.str() == "x\n");
}

TEST_CASE("Debug messages over 256 code points are dropped, not truncated", "[logging][level]") {
    Logger logger;
    CoutCapture out;

    SECTION("exactly at the cap") {
        const std::string msg(kMaxDebugOutput, 'a');
        logger.Debug(msg);
        REQUIRE(out.str() == msg + "\n");
    }
    SECTION("one over the cap") {
        logger.Debug(std::string(kMaxDebugOutput + 1, 'a'));
        logger.Debugf("%s", std::string(kMaxDebugOutput + 1, 'a').c_str());
        REQUIRE(out.str().empty());
    }
    SECTION("Debugln counts its newline") {
        logger.Debugln(std::string(kMaxDebugOutput, 'a'));
        REQUIRE(out.str().empty());
    }
    SECTION("multi-byte characters count once") {
        std::string msg;
        for (size_t i = 0; i < kMaxDebugOutput; ++i) msg += "\xC3\xA9";
        logger.Debug(msg);
        REQUIRE(out.str() == msg + "\n");
    }
    SECTION("the cap does not apply to info") {
        const std::string msg(kMaxDebugOutput * 2, 'a');
        logger.Log(msg);
        REQUIRE(out.str() == msg + "\n");
    }
}

// ============================================================================
// FORMATTER & SINKS
// ============================================================================
TEST_CASE("Formatter receives severity, call depth 4 and a %s format", "[logging][formatter]") {
    struct Seen { int severity{ -1 }; int depth{ -1 }; std::string format; std::vector<std::string> args; };
    auto seen = std::make_shared<Seen>();

    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr,
        [seen](int severity, int depth, std::string_view format, std::span<const std::string_view> args) {
            seen->severity = severity;
            seen->depth = depth;
            seen->format = std::string(format);
            seen->args.assign(args.begin(), args.end());
            return std::string("rendered");
        });
    logger.SetSink(sink);

    logger.Logf("n=%d", 5);

    REQUIRE(seen->severity == LOG_INFO);
    REQUIRE(seen->depth == kFormatCallDepth);
    REQUIRE(seen->format == "%s");
    REQUIRE(seen->args == std::vector<std::string>{ "n=5" });

    REQUIRE(sink->lines == std::vector<std::string>{ "rendered" });
    REQUIRE(sink->depths == std::vector<int>{ kSinkCallDepth });
}

TEST_CASE("Sink factory routes only the error channel", "[logging][sinks]") {
    auto errSink = std::make_shared<ProbeSink>();
    std::vector<std::string> categories;

    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug,
        [&](std::string_view category) -> std::shared_ptr<LogSink> {
            categories.emplace_back(category);
            return errSink;
        },
        TaggingFormatter());

    CoutCapture out;
    logger.Log("info");
    logger.Debug("debug");
    logger.Errorf("bad");

    REQUIRE(out.str() == "1|info\n0|debug\n");
    REQUIRE(errSink->lines == std::vector<std::string>{ "3|bad" });
    REQUIRE(categories == std::vector<std::string>{ "error" });
}

TEST_CASE("Explicit sink wins over the factory", "[logging][sinks]") {
    auto fixed = std::make_shared<ProbeSink>();
    int factoryCalls = 0;

    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug,
        [&](std::string_view) -> std::shared_ptr<LogSink> { ++factoryCalls; return nullptr; },
        TaggingFormatter());
    logger.SetSink(fixed);

    logger.Log("a");
    logger.Errorln("b");

    REQUIRE(fixed->Count() == 2);
    REQUIRE(factoryCalls == 0);
}

TEST_CASE("Factory returning null falls back to stdout", "[logging][sinks]") {
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug,
        [](std::string_view) -> std::shared_ptr<LogSink> { return nullptr; },
        TaggingFormatter());

    CoutCapture out;
    logger.Errorln("lost sink");
    REQUIRE(out.str() == "3|lost sink\n");
}

TEST_CASE("Sink write failures are counted and swallowed", "[logging][sinks]") {
    auto sink = std::make_shared<ProbeSink>();
    sink->result = ResultCode::IoError;

    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    logger.Log("one");
    logger.Errorln("two");

    REQUIRE(sink->Count() == 2);
    REQUIRE(logger.SinkFailures() == 2);
}

TEST_CASE("A throwing formatter drops the message and reports on stderr", "[logging][formatter]") {
    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr,
        [](int, int, std::string_view, std::span<const std::string_view>) -> std::string {
            throw std::runtime_error("formatter broke");
        });
    logger.SetSink(sink);

    StderrCapture err;
    REQUIRE_NOTHROW(logger.Log("x"));
    REQUIRE(sink->Count() == 0);
    REQUIRE(err.str().find("formatter broke") != std::string::npos);
}

// ============================================================================
// CONFIGURATION
// ============================================================================
TEST_CASE("Setters keep the rest of the configuration", "[logging][config]") {
    Logger logger;
    logger.SetLoggerFunc("srv:", true, Severity::Warn, nullptr, TaggingFormatter());
    logger.SetDebug(false);
    logger.SetLockMode(LockMode::Fast);

    auto cfg = logger.Config();
    REQUIRE(cfg->name_prefix == "srv:");
    REQUIRE(cfg->crash_reporting);
    REQUIRE(cfg->threshold == Severity::Warn);
    REQUIRE(static_cast<bool>(cfg->formatter));
    REQUIRE_FALSE(cfg->debug_enabled);
    REQUIRE(cfg->lock_mode == LockMode::Fast);

    logger.Configure(LogConfig{});
    cfg = logger.Config();
    REQUIRE(cfg->name_prefix.empty());
    REQUIRE(cfg->threshold == Severity::Debug);
    REQUIRE(cfg->lock_mode == LockMode::Strict);
}

TEST_CASE("Default logger free functions", "[logging][config]") {
    auto sink = std::make_shared<ProbeSink>();
    SetLoggerFunc("", false, Severity::Info, nullptr, TaggingFormatter());
    SetLogger(sink);

    REQUIRE(GetLogger() == sink);
    REQUIRE(GetLogLevel() == Severity::Info);

    Debug("hidden");
    Log("a", 1);
    Logln("b");
    Logf("c%d", 2);
    Warnf("w");
    Errorln("e");
    LIBMGOLOG_LOG(Severity::Warn, "internal");

    REQUIRE(sink->lines == std::vector<std::string>{ "1|a1", "1|b\n", "1|c2", "2|w", "3|e\n", "2|internal" });

    DefaultLogger().Configure(LogConfig{});
    REQUIRE(GetLogger() == nullptr);
}

// ============================================================================
// RE-ENTRANCY & CONCURRENCY
// ============================================================================
namespace {
    struct LoopbackSink : LogSink {
        Logger* logger{ nullptr };
        std::atomic<int> calls{ 0 };
        Status Output(int, std::string_view) noexcept override {
            calls.fetch_add(1);
            logger->Errorln("from inside the sink");
            return {};
        }
    };
}

TEST_CASE("Logging from inside a sink is dropped instead of deadlocking", "[logging][concurrency]") {
    auto sink = std::make_shared<LoopbackSink>();
    Logger logger;
    sink->logger = &logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    logger.Log("outer");
    REQUIRE(sink->calls.load() == 1);

    logger.Log("again");
    REQUIRE(sink->calls.load() == 2);
}

namespace {
    // Copies every line into a second logger.
    struct TeeSink : ProbeSink {
        Logger* other{ nullptr };
        Status Output(int callDepth, std::string_view message) noexcept override {
            auto st = ProbeSink::Output(callDepth, message);
            other->Write(Severity::Info, message);
            return st;
        }
    };

    // Drops its own sink after the first line.
    struct DetachingSink : ProbeSink {
        Logger* logger{ nullptr };
        Status Output(int callDepth, std::string_view message) noexcept override {
            auto st = ProbeSink::Output(callDepth, message);
            logger->SetSink(nullptr);
            return st;
        }
    };

    // Raises the threshold while the message is being built.
    struct RaiseThreshold {
        Logger* logger;
    };

    std::ostream& operator<<(std::ostream& os, const RaiseThreshold& r) {
        r.logger->SetLogLevel(Severity::Error);
        return os << "raised";
    }
}

TEST_CASE("A sink may log into a different logger", "[logging][concurrency]") {
    const auto mode = GENERATE(LockMode::Strict, LockMode::Fast);

    auto audit = std::make_shared<ProbeSink>();
    Logger auditLog;
    auditLog.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    auditLog.SetSink(audit);

    auto tee = std::make_shared<TeeSink>();
    tee->other = &auditLog;
    Logger mainLog;
    mainLog.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    mainLog.SetSink(tee);
    mainLog.SetLockMode(mode);

    mainLog.Log("hello");

    REQUIRE(tee->lines == std::vector<std::string>{ "1|hello" });
    REQUIRE(audit->lines == std::vector<std::string>{ "1|1|hello" });
}

TEST_CASE("A cycle between two loggers stops at the first repeat", "[logging][concurrency]") {
    auto teeA = std::make_shared<TeeSink>();
    auto teeB = std::make_shared<TeeSink>();
    Logger a;
    Logger b;
    teeA->other = &b;
    teeB->other = &a;
    a.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    b.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    a.SetSink(teeA);
    b.SetSink(teeB);

    a.Log("ping");

    REQUIRE(teeA->lines == std::vector<std::string>{ "1|ping" });
    REQUIRE(teeB->lines == std::vector<std::string>{ "1|1|ping" });
}

TEST_CASE("Setters called from inside a sink are refused", "[logging][config]") {
    auto sink = std::make_shared<DetachingSink>();
    Logger logger;
    sink->logger = &logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    StderrCapture err;
    logger.Log("first");
    logger.Log("second");
    const auto diag = err.str();

    REQUIRE(sink->lines == std::vector<std::string>{ "1|first", "1|second" });
    REQUIRE(logger.Config()->sink == sink);
    REQUIRE(diag.find("refused") != std::string::npos);
}

TEST_CASE("Threshold is checked against the configuration the line is written with", "[logging][level]") {
    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Info, nullptr, TaggingFormatter());
    logger.SetSink(sink);

    logger.Log(RaiseThreshold{ &logger });

    REQUIRE(sink->Count() == 0);
    REQUIRE(logger.Config()->threshold == Severity::Error);
}

TEST_CASE("Concurrent emitters deliver every line", "[logging][concurrency]") {
    const auto mode = GENERATE(LockMode::Strict, LockMode::Fast);

    auto sink = std::make_shared<ProbeSink>();
    Logger logger;
    logger.SetLoggerFunc("", false, Severity::Debug, nullptr, TaggingFormatter());
    logger.SetSink(sink);
    logger.SetLockMode(mode);

    const int THREADS = 8, ITERS = 200;
    std::vector<std::thread> th;
    for (int t = 0; t < THREADS; ++t) {
        th.emplace_back([&, t] {
            for (int i = 0; i < ITERS; ++i) {
                if (i % 2) logger.Logf("t%d i%d", t, i);
                else logger.Errorln("t", t, "i", i);
            }
        });
    }

    // Reconfigure while logging; every emission must still see a whole snapshot.
    for (int i = 0; i < 50; ++i) logger.SetDebug(i % 2 == 0);

    for (auto& x : th) x.join();
    REQUIRE(sink->Count() == static_cast<size_t>(THREADS * ITERS));
}
