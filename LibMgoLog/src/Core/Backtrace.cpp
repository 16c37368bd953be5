#include "LibMgoLog/Core/Backtrace.h"

#include <cerrno>
#include <cstdlib>
#include <memory>
#include <cxxabi.h>
#include <execinfo.h>
#include <unistd.h>

#include "LibMgoLog/Core/Logging.h"

namespace libmgolog {
    namespace {
        constexpr int kMaxFrames = 64;

        // "binary(mangled+0x1f) [0x...]" -> "binary(demangled+0x1f) [0x...]"
        std::string Demangle(const char* symbol) {
            std::string line(symbol);
            const auto open = line.find('(');
            const auto plus = line.find('+', open);
            if (open == std::string::npos || plus == std::string::npos || plus == open + 1) return line;

            const std::string mangled = line.substr(open + 1, plus - open - 1);
            int status = 0;
            std::unique_ptr<char, void (*)(void*)> demangled(
                abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status), std::free);
            if (status != 0 || !demangled) return line;
            return line.substr(0, open + 1) + demangled.get() + line.substr(plus);
        }
    }

    std::string CaptureStack() {
        void* frames[kMaxFrames];
        const int n = ::backtrace(frames, kMaxFrames);
        if (n <= 0) return {};

        std::unique_ptr<char*, void (*)(void*)> symbols(::backtrace_symbols(frames, n), std::free);
        std::string out;
        for (int i = 0; i < n; ++i) {
            if (symbols) out += Demangle(symbols.get()[i]);
            else out += "??";
            out += '\n';
        }
        return out;
    }

    void WriteStderr(std::string_view text) noexcept {
        const char* p = text.data();
        size_t left = text.size();
        while (left > 0) {
            const ssize_t w = ::write(STDERR_FILENO, p, left);
            if (w < 0) {
                if (errno == EINTR) continue;
                return;
            }
            p += w;
            left -= static_cast<size_t>(w);
        }
    }

    void ReportCrash(Logger& logger, std::string_view name) noexcept {
        logger.Errorf("worker[%.*s] is exiting...\n", static_cast<int>(name.size()), name.data());

        std::string stack;
        try {
            stack = CaptureStack();
        }
        catch (const std::exception&) {
            // Out of memory while symbolizing; dump raw frames instead.
            void* frames[kMaxFrames];
            const int n = ::backtrace(frames, kMaxFrames);
            if (n > 0) ::backtrace_symbols_fd(frames, n, STDERR_FILENO);
            return;
        }

        WriteStderr(stack);
        logger.Errorln(stack);
    }

    void ReportCrash(std::string_view name) noexcept {
        ReportCrash(DefaultLogger(), name);
    }

} // namespace libmgolog
