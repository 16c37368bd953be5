#pragma once
#include <span>
#include <string>
#include <string_view>
#include "LibMgoLog/Core/Callbacks.h"

namespace libmgolog {

    struct StandardFormatterOptions {
        bool color{ true };       // ANSI colored severity tags
        bool timestamp{ true };   // local "YYYY/MM/DD HH:MM:SS" after the tag
    };

    // Substitutes "%s" placeholders with args in order; "%%" yields '%'.
    // Placeholders without a matching argument are kept verbatim.
    std::string ExpandFormat(std::string_view format, std::span<const std::string_view> args);

    // Formatter producing "<tag> <time> <message>". ERROR and FATAL lines start
    // with kErrorMarker (colored) or kPlainErrorMarker so crash reports can be
    // stripped. callDepth is ignored.
    Formatter MakeStandardFormatter(StandardFormatterOptions opts = {});

} // namespace libmgolog
