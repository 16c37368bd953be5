#include "LibMgoLog/Core/CrashReporter.h"

namespace libmgolog {

    std::string ComposeCrashReport(std::string_view namePrefix, std::string_view rendered) {
        if (rendered.starts_with(kErrorMarker)) rendered.remove_prefix(kErrorMarker.size());
        else if (rendered.starts_with(kPlainErrorMarker)) rendered.remove_prefix(kPlainErrorMarker.size());
        std::string out;
        out.reserve(namePrefix.size() + rendered.size());
        out.append(namePrefix);
        out.append(rendered);
        return out;
    }

} // namespace libmgolog
