#pragma once
#include <string>
#include <string_view>

namespace libmgolog {

    // Colored tag the standard formatter puts in front of ERROR/FATAL lines.
    inline constexpr std::string_view kErrorMarker = "\033[031;1m[ERROR]\033[031;0m";
    inline constexpr std::string_view kPlainErrorMarker = "[ERROR]";

    // Client of an external error-tracking service.
    // Capture() is fire-and-forget: it never blocks on acknowledgement and
    // never reports failure back to the logging caller.
    class CrashReporter {
    public:
        virtual ~CrashReporter() = default;
        virtual void Capture(std::string_view message) noexcept = 0;
    };

    // Builds the forwarded text: the leading error marker (colored or plain)
    // is removed when present, then namePrefix is prepended.
    std::string ComposeCrashReport(std::string_view namePrefix, std::string_view rendered);

} // namespace libmgolog
