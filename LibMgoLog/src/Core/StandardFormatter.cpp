#include "LibMgoLog/Core/StandardFormatter.h"

#include <chrono>
#include <ctime>

#include "LibMgoLog/Core/CrashReporter.h"
#include "LibMgoLog/Core/Types.h"

namespace libmgolog {
    namespace {
        std::string_view Tag(int severity, bool color) noexcept {
            if (severity >= LOG_ERROR) return color ? kErrorMarker : kPlainErrorMarker;
            if (color) {
                switch (severity) {
                case LOG_DEBUG: return "\033[036;1m[DEBUG]\033[036;0m";
                case LOG_INFO:  return "\033[032;1m[INFO]\033[032;0m";
                default:        return "\033[033;1m[WARN]\033[033;0m";
                }
            }
            switch (severity) {
            case LOG_DEBUG: return "[DEBUG]";
            case LOG_INFO:  return "[INFO]";
            default:        return "[WARN]";
            }
        }

        std::string Now() {
            const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm tm{};
            localtime_r(&t, &tm);
            char buf[32];
            const size_t n = std::strftime(buf, sizeof(buf), "%Y/%m/%d %H:%M:%S", &tm);
            return std::string(buf, n);
        }
    }

    std::string ExpandFormat(std::string_view format, std::span<const std::string_view> args) {
        std::string out;
        out.reserve(format.size() + (args.empty() ? 0 : args.front().size()));
        size_t next = 0;
        for (size_t i = 0; i < format.size(); ++i) {
            const char c = format[i];
            if (c != '%' || i + 1 >= format.size()) { out += c; continue; }
            const char spec = format[i + 1];
            if (spec == '%') {
                out += '%';
                ++i;
            }
            else if (spec == 's' && next < args.size()) {
                out.append(args[next++]);
                ++i;
            }
            else {
                out += c;
            }
        }
        return out;
    }

    Formatter MakeStandardFormatter(StandardFormatterOptions opts) {
        return [opts](int severity, int /*callDepth*/, std::string_view format,
            std::span<const std::string_view> args) {
            std::string line(Tag(severity, opts.color));
            line += ' ';
            if (opts.timestamp) {
                line += Now();
                line += ' ';
            }
            line += ExpandFormat(format, args);
            return line;
        };
    }

} // namespace libmgolog
