#pragma once
/**
 * @file Backtrace.h
 * @brief Stack capture for worker threads that terminate abnormally.
 */

#include <string>
#include <string_view>

namespace libmgolog {

    class Logger;

    /// Symbolized stack of the calling thread, one frame per line.
    std::string CaptureStack();

    /**
     * @brief Write raw bytes to file descriptor 2.
     *
     * Does not touch any logger state, so it keeps working when the logging
     * configuration is broken. Retries on EINTR and partial writes.
     */
    void WriteStderr(std::string_view text) noexcept;

    /**
     * @brief Report that the named worker is exiting abnormally.
     *
     * Emits "worker[<name>] is exiting..." at Error level, writes the current
     * stack straight to standard error, then emits the same stack through
     * Errorln so it also reaches the configured sink and crash reporter.
     */
    void ReportCrash(Logger& logger, std::string_view name) noexcept;

    /// ReportCrash() on the default logger.
    void ReportCrash(std::string_view name) noexcept;

} // namespace libmgolog
