#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "LibMgoLog/LibMgoLog.h"
#include "examples/common/CategorySinks.h"

using namespace std::chrono_literals;

// Stand-in for a driver component that logs through the facade.
static void ping_server(const std::string& addr, int round) {
    libmgolog::Debugf("ping %s round %d", addr.c_str(), round);
    if (round == 3 && addr == "db2:27017") {
        throw std::runtime_error("no reachable servers");
    }
    libmgolog::Logln("ping ok", addr, "rtt", round * 2, "ms");
}

int main() {
    // Configure once, before any worker starts.
    libmgolog::SetLoggerFunc("example:", false, libmgolog::Severity::Debug,
        MakeCategorySinks(), libmgolog::MakeStandardFormatter());
    libmgolog::SetDebug(true);

    libmgolog::Logf("driver starting with %d seeds", 2);

    std::vector<std::unique_ptr<libmgolog::ScopedTask>> workers;
    for (const std::string addr : { "db1:27017", "db2:27017" }) {
        workers.push_back(std::make_unique<libmgolog::ScopedTask>("pinger-" + addr, [addr] {
            for (int round = 1; round <= 4; ++round) {
                ping_server(addr, round);
                std::this_thread::sleep_for(10ms);
            }
        }));
    }

    for (auto& w : workers) w->Join();

    int failed = 0;
    for (auto& w : workers) if (w->Failure()) ++failed;
    libmgolog::Errorf("%d of %zu pingers exited abnormally", failed, workers.size());
    return 0;
}
