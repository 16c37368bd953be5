// LibMgoLog.Bench.cpp
// Emission latency of the facade under contention.
// Modes: strict, fast (LockMode), each with a null sink so only facade cost is measured.
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "LibMgoLog/LibMgoLog.h"

using namespace std::chrono;

struct NullSink final : libmgolog::LogSink {
    std::atomic<uint64_t> lines{ 0 };
    libmgolog::Status Output(int, std::string_view) noexcept override {
        lines.fetch_add(1, std::memory_order_relaxed);
        return {};
    }
};

struct Percentiles { double p50{ 0 }, p95{ 0 }, p99{ 0 }; };
static Percentiles pct_from_ns(std::vector<uint64_t>& ns) {
    Percentiles r{};
    if (ns.empty()) return r;
    auto nth = [&](double q)->double {
        size_t k = static_cast<size_t>(q * (ns.size() - 1));
        std::nth_element(ns.begin(), ns.begin() + k, ns.end());
        return ns[k] / 1e3; // us
        };
    r.p50 = nth(0.50); r.p95 = nth(0.95); r.p99 = nth(0.99);
    return r;
}

struct Args {
    std::string mode = "strict";
    int msgs = 20000;     // per thread
    int threads = 8;
    size_t payload_sz = 120;
};
static Args parse_args(int argc, char** argv) {
    Args a;
    auto next = [&](int& i)->const char* { if (i + 1 < argc) return argv[++i]; std::exit(2); };
    for (int i = 1; i < argc; ++i) {
        std::string k = argv[i];
        if (k == "--mode") a.mode = next(i);
        else if (k == "--msg") a.msgs = std::atoi(next(i));
        else if (k == "--threads") a.threads = std::atoi(next(i));
        else if (k == "--size") a.payload_sz = static_cast<size_t>(std::atoll(next(i)));
        else { std::cerr << "Unknown arg: " << k << "\n"; std::exit(2); }
    }
    return a;
}

int main(int argc, char** argv) {
    const Args args = parse_args(argc, argv);
    if (args.mode != "strict" && args.mode != "fast") {
        std::cerr << "--mode must be strict or fast\n";
        return 2;
    }

    auto sink = std::make_shared<NullSink>();
    libmgolog::Logger logger;
    logger.SetLoggerFunc("bench:", false, libmgolog::Severity::Info, nullptr,
        libmgolog::MakeStandardFormatter({ .color = false, .timestamp = false }));
    logger.SetSink(sink);
    logger.SetLockMode(args.mode == "fast" ? libmgolog::LockMode::Fast : libmgolog::LockMode::Strict);

    const std::string payload(args.payload_sz, 'x');
    std::vector<std::vector<uint64_t>> lat(static_cast<size_t>(args.threads));

    const auto t0 = steady_clock::now();
    std::vector<std::thread> th;
    for (int t = 0; t < args.threads; ++t) {
        th.emplace_back([&, t] {
            auto& mine = lat[static_cast<size_t>(t)];
            mine.reserve(static_cast<size_t>(args.msgs));
            for (int i = 0; i < args.msgs; ++i) {
                const auto s = steady_clock::now();
                if (i % 4 == 0) logger.Debug("dropped ", i);   // filtered by threshold
                else logger.Logf("t=%d i=%d %s", t, i, payload.c_str());
                mine.push_back(static_cast<uint64_t>(duration_cast<nanoseconds>(steady_clock::now() - s).count()));
            }
        });
    }
    for (auto& x : th) x.join();
    const double secs = duration_cast<duration<double>>(steady_clock::now() - t0).count();

    std::vector<uint64_t> all;
    for (auto& v : lat) all.insert(all.end(), v.begin(), v.end());
    const auto p = pct_from_ns(all);

    std::cout << std::fixed << std::setprecision(2)
        << "mode=" << args.mode
        << " threads=" << args.threads
        << " calls=" << all.size()
        << " written=" << sink->lines.load()
        << " throughput=" << (all.size() / secs) << "/s"
        << " p50=" << p.p50 << "us p95=" << p.p95 << "us p99=" << p.p99 << "us\n";
    return 0;
}
