#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "LibMgoLog/Core/Types.h"
#include "LibMgoLog/Core/Callbacks.h"
#include "LibMgoLog/Core/CrashReporter.h"

namespace mqtt { class async_client; }

namespace libmgolog::report {

    struct MqttCrashReporterOptions {
        std::string topic{ "mgo/crash" };
        QoS         qos{ QoS::AtLeastOnce };
        bool        retained{ false };
        std::chrono::milliseconds connect_timeout{ std::chrono::seconds(5) };
        std::chrono::seconds      keep_alive{ 20 };
        // Paho retries lost connections between these bounds, so a broker
        // restart does not silence reports for good.
        std::chrono::seconds      reconnect_min{ 1 };
        std::chrono::seconds      reconnect_max{ 30 };
    };

    // MqttCrashReporter
    // -----------------
    // Forwards crash reports to an MQTT topic for an alerting consumer.
    // Capture() queues the publish on the Paho client and returns without
    // waiting for the broker ACK. Reports captured while disconnected, or
    // rejected by Paho, are counted in Dropped() and reported through the
    // error callback; nothing is retried.
    //
    // Capture() runs inside a log emission: it never logs through the facade.
    // Non-throwing: all methods return Status; no exceptions escape the API.
    class MqttCrashReporter final : public CrashReporter {
    public:
        MqttCrashReporter(std::string brokerUri, std::string clientId,
            MqttCrashReporterOptions opts = {});
        ~MqttCrashReporter() override;

        MqttCrashReporter(const MqttCrashReporter&) = delete;
        MqttCrashReporter& operator=(const MqttCrashReporter&) = delete;

        // Establish the connection (blocking until CONNACK or timeout).
        // InvalidArgument when the topic is empty or holds a wildcard.
        Status Connect(const std::optional<ConnectionOptions>& opts = std::nullopt) noexcept;

        // Disconnect quietly. Always returns Ok.
        Status Disconnect() noexcept;

        bool IsConnected() const noexcept;

        void Capture(std::string_view message) noexcept override;

        // Wait for queued reports to be delivered (best-effort).
        // Returns Timeout if not drained by 'timeout'.
        Status Flush(std::chrono::milliseconds timeout = std::chrono::seconds(5)) noexcept;

        // Invoked when a report is dropped or the connection is lost.
        void SetErrorCallback(ErrorCallback cb) noexcept;

        std::uint64_t Sent() const noexcept;
        std::uint64_t Dropped() const noexcept;

        const MqttCrashReporterOptions& Options() const noexcept { return opts_; }

    private:
        struct Impl;
        MqttCrashReporterOptions opts_;
        std::unique_ptr<Impl>    impl_;
    };

} // namespace libmgolog::report
