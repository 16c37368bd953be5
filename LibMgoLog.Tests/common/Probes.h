#pragma once
#include <atomic>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

#include "LibMgoLog/LibMgoLog.h"

namespace testutil {

    // Records every line it receives.
    struct ProbeSink : libmgolog::LogSink {
        mutable std::mutex       mu;
        std::vector<std::string> lines;
        std::vector<int>         depths;
        libmgolog::ResultCode    result{ libmgolog::ResultCode::Ok };

        libmgolog::Status Output(int callDepth, std::string_view message) noexcept override {
            std::lock_guard<std::mutex> lk(mu);
            lines.emplace_back(message);
            depths.push_back(callDepth);
            return { result };
        }

        size_t Count() const {
            std::lock_guard<std::mutex> lk(mu);
            return lines.size();
        }

        std::string Last() const {
            std::lock_guard<std::mutex> lk(mu);
            return lines.empty() ? std::string{} : lines.back();
        }
    };

    // Records forwarded crash reports.
    struct ProbeReporter : libmgolog::CrashReporter {
        std::mutex               mu;
        std::vector<std::string> reports;

        void Capture(std::string_view message) noexcept override {
            std::lock_guard<std::mutex> lk(mu);
            reports.emplace_back(message);
        }
    };

    // Formatter that tags the line with the numeric severity: "<sev>|<content>".
    inline libmgolog::Formatter TaggingFormatter() {
        return [](int severity, int, std::string_view format, std::span<const std::string_view> args) {
            return std::to_string(severity) + "|" + libmgolog::ExpandFormat(format, args);
        };
    }

    // Redirects std::cout into a string for the lifetime of the object.
    class CoutCapture {
    public:
        CoutCapture() : old_(std::cout.rdbuf(buf_.rdbuf())) {}
        ~CoutCapture() { std::cout.rdbuf(old_); }
        std::string str() const { return buf_.str(); }
    private:
        std::ostringstream buf_;
        std::streambuf*    old_;
    };

    // Redirects file descriptor 2 into a temporary file.
    class StderrCapture {
    public:
        StderrCapture() : tmp_(std::tmpfile()) {
            std::fflush(stderr);
            saved_ = ::dup(STDERR_FILENO);
            if (tmp_) ::dup2(::fileno(tmp_), STDERR_FILENO);
        }
        ~StderrCapture() {
            Restore();
            if (tmp_) std::fclose(tmp_);
        }

        std::string str() {
            Restore();
            std::string out;
            if (!tmp_) return out;
            std::rewind(tmp_);
            char buf[4096];
            size_t n;
            while ((n = std::fread(buf, 1, sizeof(buf), tmp_)) > 0) out.append(buf, n);
            return out;
        }

    private:
        void Restore() {
            if (saved_ < 0) return;
            std::fflush(stderr);
            ::dup2(saved_, STDERR_FILENO);
            ::close(saved_);
            saved_ = -1;
        }

        std::FILE* tmp_;
        int        saved_{ -1 };
    };

} // namespace testutil
