#include <chrono>
#include <iostream>
#include <memory>
#include "LibMgoLog/LibMgoLog.h"

using namespace std::chrono_literals;

int main(int argc, char** argv) {
    const std::string broker = argc > 1 ? argv[1] : "mqtt://localhost:1883";

    libmgolog::report::MqttCrashReporterOptions opts;
    opts.topic = "mgo/crash";
    auto reporter = std::make_shared<libmgolog::report::MqttCrashReporter>(broker, "ex-crash-reporter", opts);
    reporter->SetErrorCallback([](libmgolog::ResultCode code, std::string_view what) {
        std::cerr << "crash report dropped (" << libmgolog::ToString(code) << "): " << what << "\n";
    });

    libmgolog::SetLoggerFunc("ex-node:", true, libmgolog::Severity::Info, nullptr,
        libmgolog::MakeStandardFormatter());
    libmgolog::SetCrashReporter(reporter);

    if (!reporter->Connect().ok()) { std::cerr << "connect failed\n"; return 1; }

    libmgolog::Log("connected to crash topic ", opts.topic);
    libmgolog::Errorf("primary %s stepped down", "db1:27017");
    libmgolog::ReportCrash("example-worker");

    (void)reporter->Flush(5s);
    std::cout << "sent: " << reporter->Sent() << " dropped: " << reporter->Dropped() << "\n";
    (void)reporter->Disconnect();
    return 0;
}
