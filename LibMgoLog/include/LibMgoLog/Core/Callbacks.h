#pragma once
/**
 * @file Callbacks.h
 * @brief Injected callback signatures and the lock-free snapshot holder.
 */

#include <atomic>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include "LibMgoLog/Core/Types.h"

namespace libmgolog {

    class LogSink;

    /**
     * @brief Category-keyed sink factory.
     *
     * Invoked with the message category ("" or "error") when no explicit sink
     * is installed. May return nullptr, in which case the message goes to
     * standard output.
     */
    using SinkFactory = std::function<std::shared_ptr<LogSink>(std::string_view category)>;

    /**
     * @brief Rendering function.
     *
     * @param severity  Numeric severity (LOG_DEBUG..LOG_FATAL).
     * @param callDepth Frames between the caller and the formatter.
     * @param format    printf-style format; "%s" on the facade path.
     * @param args      Arguments consumed by @p format.
     * @return The final line handed to the sink and the crash reporter.
     */
    using Formatter = std::function<std::string(int severity,
        int callDepth,
        std::string_view format,
        std::span<const std::string_view> args)>;

    /**
     * @brief Callback to handle transport errors (e.g. a dropped crash report).
     *
     * @param code The error code representing the failure type.
     * @param what A description of the error.
     */
    using ErrorCallback = std::function<void(ResultCode code, std::string_view what)>;

    /**
     * @brief Read-copy-update holder.
     *
     * Readers take a shared_ptr snapshot without locking; writers publish a
     * whole new value. Used for the logger configuration and for hot callbacks.
     *
     * @tparam T Stored value type.
     */
    template <class T>
    class RcuCell {
    public:
        RcuCell() = default;
        explicit RcuCell(T v) : p_(std::make_shared<const T>(std::move(v))) {}

        /**
         * @brief Publish a new value.
         * @param v The value readers will observe from now on.
         */
        void set(T v) {
            p_.store(std::make_shared<const T>(std::move(v)), std::memory_order_release);
        }

        /**
         * @brief Get the current value.
         * @return Snapshot, or nullptr if nothing was ever set.
         */
        std::shared_ptr<const T> get() const noexcept {
            return p_.load(std::memory_order_acquire);
        }

    private:
        std::atomic<std::shared_ptr<const T>> p_{ nullptr };
    };

} // namespace libmgolog
