#include "LibMgoLog/Core/ScopedTask.h"

#include "LibMgoLog/Core/Backtrace.h"
#include "LibMgoLog/Core/Logging.h"

namespace libmgolog {

    ScopedTask::ScopedTask(std::string name, std::function<void()> body)
        : ScopedTask(DefaultLogger(), std::move(name), std::move(body)) {
    }

    ScopedTask::ScopedTask(Logger& logger, std::string name, std::function<void()> body)
        : logger_(logger), name_(std::move(name)) {
        thread_ = std::thread([this, b = std::move(body)]() mutable { Run(std::move(b)); });
    }

    ScopedTask::~ScopedTask() {
        Join();
    }

    void ScopedTask::Join() {
        if (thread_.joinable()) thread_.join();
    }

    void ScopedTask::Rethrow() {
        Join();
        if (failure_) std::rethrow_exception(failure_);
    }

    void ScopedTask::Run(std::function<void()> body) noexcept {
        try {
            if (body) body();
            return;
        }
        catch (const std::exception& e) {
            failure_ = std::current_exception();
            logger_.Errorf("worker[%s] failed: %s\n", name_.c_str(), e.what());
        }
        catch (...) {
            failure_ = std::current_exception();
            logger_.Errorf("worker[%s] failed: non-standard exception\n", name_.c_str());
        }
        ReportCrash(logger_, name_);
    }

} // namespace libmgolog
