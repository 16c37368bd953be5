#include "LibMgoLog/Report/MqttCrashReporter.h"

#include <atomic>
#include <filesystem>
#include <string>
#include <thread>

#include "mqtt/async_client.h"
#include "LibMgoLog/Core/Logging.h"

namespace libmgolog::report {
    namespace {
        // Reports are published, never subscribed: wildcards are not valid here.
        bool IsPublishTopic(std::string_view topic) noexcept {
            return !topic.empty() && topic.find_first_of("+#") == std::string_view::npos;
        }

        std::string PathString(const std::filesystem::path& p) {
            return p.empty() ? std::string{} : p.string();
        }

        mqtt::connect_options BuildConnectOptions(const MqttCrashReporterOptions& ro,
            const std::optional<ConnectionOptions>& co)
        {
            auto b = mqtt::connect_options_builder()
                .clean_session()
                .connect_timeout(ro.connect_timeout)
                .keep_alive_interval(ro.keep_alive)
                .automatic_reconnect(ro.reconnect_min, ro.reconnect_max);

            if (!co) return b.finalize();

            if (!co->username.empty()) {
                b.user_name(co->username);
                b.password(co->password);
            }
            if (co->tls) {
                mqtt::ssl_options ssl;
                if (auto ca = PathString(co->tls->ca_file_path); !ca.empty()) ssl.set_trust_store(ca);
                if (auto cert = PathString(co->tls->client_cert_path); !cert.empty()) ssl.set_key_store(cert);
                if (auto key = PathString(co->tls->client_key_path); !key.empty()) ssl.set_private_key(key);
                ssl.set_enable_server_cert_auth(co->tls->enable_server_cert_auth);
                b.ssl(ssl);
            }
            return b.finalize();
        }
    }

    struct MqttCrashReporter::Impl : public virtual mqtt::callback {
        mqtt::async_client          client;
        std::atomic<std::uint64_t>  sent{ 0 };
        std::atomic<std::uint64_t>  dropped{ 0 };
        RcuCell<ErrorCallback>      err_cb;

        explicit Impl(std::string brokerUri, std::string clientId)
            : client(std::move(brokerUri), std::move(clientId))
        {
            client.set_callback(*this);
        }

        void Fail(ResultCode code, std::string_view what) noexcept {
            if (auto cb = err_cb.get(); cb && *cb) (*cb)(code, what);
        }

        // mqtt::callback (Paho thread, outside any emission)
        void connected(const std::string&) override {
            LIBMGOLOG_LOG(Severity::Info, "crash reporter: connected");
        }
        void connection_lost(const std::string& cause) override {
            Fail(ResultCode::Disconnected, cause);
            LIBMGOLOG_LOG(Severity::Warn, "crash reporter: connection lost");
        }
        void message_arrived(mqtt::const_message_ptr) override {
            // reporter doesn't consume messages
        }
        void delivery_complete(mqtt::delivery_token_ptr) override {
            // Capture() doesn't wait on tokens; Flush() drains them
        }
    };

    MqttCrashReporter::MqttCrashReporter(std::string brokerUri, std::string clientId,
        MqttCrashReporterOptions opts)
        : opts_(std::move(opts)),
          impl_(std::make_unique<Impl>(std::move(brokerUri), std::move(clientId))) {
    }

    MqttCrashReporter::~MqttCrashReporter() {
        (void)Disconnect();
    }

    Status MqttCrashReporter::Connect(const std::optional<ConnectionOptions>& opts) noexcept {
        if (!IsPublishTopic(opts_.topic)) return Status{ ResultCode::InvalidArgument };
        if (impl_->client.is_connected()) return Status{ ResultCode::Ok };

        ResultCode code = ResultCode::Ok;
        std::string what;
        try {
            auto tok = impl_->client.connect(BuildConnectOptions(opts_, opts));
            if (!tok->wait_for(opts_.connect_timeout)) {
                code = ResultCode::Timeout;
                what = "crash reporter: timeout waiting for CONNACK";
            }
            else if (!impl_->client.is_connected()) {
                code = ResultCode::ProtocolError;
                what = "crash reporter: not connected after CONNACK";
            }
        }
        catch (const mqtt::exception& e) {
            code = ResultCode::ProtocolError;
            what = std::string("crash reporter: connect exception: ") + e.what();
        }
        catch (const std::exception& e) {
            code = ResultCode::Unknown;
            what = std::string("crash reporter: connect failed: ") + e.what();
        }

        if (code != ResultCode::Ok) {
            LIBMGOLOG_LOG(Severity::Warn, what);
            impl_->Fail(code, what);
        }
        return Status{ code };
    }

    Status MqttCrashReporter::Disconnect() noexcept {
        try {
            if (impl_->client.is_connected()) impl_->client.disconnect()->wait();
        }
        catch (const std::exception& e) {
            LIBMGOLOG_LOG(Severity::Debug, std::string("crash reporter: disconnect: ") + e.what());
        }
        return Status{ ResultCode::Ok };
    }

    bool MqttCrashReporter::IsConnected() const noexcept {
        return impl_->client.is_connected();
    }

    void MqttCrashReporter::Capture(std::string_view message) noexcept {
        if (!impl_->client.is_connected()) {
            impl_->dropped.fetch_add(1, std::memory_order_relaxed);
            impl_->Fail(ResultCode::Disconnected, "crash reporter: not connected, report dropped");
            return;
        }

        try {
            auto msg = mqtt::make_message(opts_.topic, message.data(), message.size());
            msg->set_qos(static_cast<int>(opts_.qos));
            msg->set_retained(opts_.retained);
            impl_->client.publish(msg);
            impl_->sent.fetch_add(1, std::memory_order_relaxed);
        }
        catch (const mqtt::exception& e) {
            impl_->dropped.fetch_add(1, std::memory_order_relaxed);
            impl_->Fail(ResultCode::ProtocolError, e.what());
        }
        catch (const std::exception& e) {
            impl_->dropped.fetch_add(1, std::memory_order_relaxed);
            impl_->Fail(ResultCode::Unknown, e.what());
        }
    }

    Status MqttCrashReporter::Flush(std::chrono::milliseconds timeout) noexcept {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        try {
            for (;;) {
                auto pend = impl_->client.get_pending_delivery_tokens();
                if (pend.empty()) break;

                for (auto& t : pend) {
                    if (!t) continue;
                    t->wait_for(std::chrono::milliseconds(1));
                }

                if (std::chrono::steady_clock::now() >= deadline) {
                    LIBMGOLOG_LOG(Severity::Warn, "crash reporter: flush timeout");
                    return Status{ ResultCode::Timeout };
                }
                std::this_thread::yield();
            }
            return Status{ ResultCode::Ok };
        }
        catch (const mqtt::exception& e) {
            LIBMGOLOG_LOG(Severity::Warn, std::string("crash reporter: flush exception: ") + e.what());
            return Status{ ResultCode::ProtocolError };
        }
        catch (const std::exception& e) {
            LIBMGOLOG_LOG(Severity::Warn, std::string("crash reporter: flush failed: ") + e.what());
            return Status{ ResultCode::Unknown };
        }
    }

    void MqttCrashReporter::SetErrorCallback(ErrorCallback cb) noexcept {
        impl_->err_cb.set(std::move(cb));
    }

    std::uint64_t MqttCrashReporter::Sent() const noexcept {
        return impl_->sent.load(std::memory_order_relaxed);
    }

    std::uint64_t MqttCrashReporter::Dropped() const noexcept {
        return impl_->dropped.load(std::memory_order_relaxed);
    }

} // namespace libmgolog::report
