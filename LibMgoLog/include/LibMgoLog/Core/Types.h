#pragma once
#include <optional>
#include <string>
#include <filesystem>

namespace libmgolog {

    // Ordered severities; only messages at or above the threshold are emitted.
    enum class Severity {
        Debug = 0,
        Info  = 1,
        Warn  = 2,
        Error = 3,
        Fatal = 4
    };

    // Named integer constants for callers that work with raw levels.
    inline constexpr int LOG_DEBUG = 0;
    inline constexpr int LOG_INFO  = 1;
    inline constexpr int LOG_WARN  = 2;
    inline constexpr int LOG_ERROR = 3;
    inline constexpr int LOG_FATAL = 4;

    inline constexpr const char* ToString(Severity s) noexcept {
        switch (s) {
        case Severity::Debug: return "DEBUG";
        case Severity::Info:  return "INFO";
        case Severity::Warn:  return "WARN";
        case Severity::Error: return "ERROR";
        case Severity::Fatal: return "FATAL";
        default:              return "UNKNOWN";
        }
    }

    // Non-throwing status code for API returns
    enum class ResultCode {
        Ok,
        Timeout,
        Disconnected,
        ProtocolError,
        IoError,
        InvalidArgument,
        Unknown
    };

    struct Status {
        ResultCode code{ ResultCode::Ok };
        constexpr bool ok() const noexcept { return code == ResultCode::Ok; }
    };

    inline constexpr const char* ToString(ResultCode c) noexcept {
        switch (c) {
        case ResultCode::Ok:              return "Ok";
        case ResultCode::Timeout:         return "Timeout";
        case ResultCode::Disconnected:    return "Disconnected";
        case ResultCode::ProtocolError:   return "ProtocolError";
        case ResultCode::IoError:         return "IoError";
        case ResultCode::InvalidArgument: return "InvalidArgument";
        default:                          return "Unknown";
        }
    }

    // MQTT delivery guarantee used by the crash reporter transport.
    enum class QoS {
        AtMostOnce = 0,
        AtLeastOnce = 1,
        ExactlyOnce = 2
    };

    struct TlsOptions {
        std::filesystem::path ca_file_path;       // CA trust store (PEM)
        std::filesystem::path client_cert_path;   // Client cert (optional)
        std::filesystem::path client_key_path;    // Client key (optional)
        bool                  enable_server_cert_auth{ true };
    };

    struct ConnectionOptions {
        std::string                 username;
        std::string                 password;
        std::optional<TlsOptions>   tls;
    };

} // namespace libmgolog
