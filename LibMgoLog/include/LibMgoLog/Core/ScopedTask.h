#pragma once
#include <exception>
#include <functional>
#include <string>
#include <thread>

namespace libmgolog {

    class Logger;

    // ScopedTask
    // ----------
    // Named worker thread with a crash hook. If the body throws, the exception
    // message is logged at Error level, ReportCrash(name) dumps the stack, and
    // the exception is kept so the owner can inspect or rethrow it after Join().
    // The destructor joins.
    class ScopedTask {
    public:
        ScopedTask(std::string name, std::function<void()> body);
        ScopedTask(Logger& logger, std::string name, std::function<void()> body);
        ~ScopedTask();

        ScopedTask(const ScopedTask&) = delete;
        ScopedTask& operator=(const ScopedTask&) = delete;

        void Join();

        const std::string& Name() const noexcept { return name_; }

        // Valid after Join(). Null when the body returned normally.
        std::exception_ptr Failure() const noexcept { return failure_; }

        // Join, then rethrow the body's exception if there was one.
        void Rethrow();

    private:
        void Run(std::function<void()> body) noexcept;

        Logger&             logger_;
        std::string         name_;
        std::exception_ptr  failure_;
        std::thread         thread_;
    };

} // namespace libmgolog
