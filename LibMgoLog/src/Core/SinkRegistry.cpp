#include "LibMgoLog/Core/SinkRegistry.h"

namespace libmgolog {

    std::shared_ptr<LogSink> ResolveSink(const LogConfig& cfg, std::string_view category) {
        if (cfg.sink) return cfg.sink;
        if (!category.empty() && cfg.sink_factory) return cfg.sink_factory(category);
        return nullptr;
    }

} // namespace libmgolog
