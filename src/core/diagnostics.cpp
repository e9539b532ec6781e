/// @file diagnostics.cpp
/// @brief Diagnostic collection and stderr echo

#include "core/diagnostics.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cstdio>

namespace costumemaster {

void DiagnosticLog::report(Severity severity, std::string title, std::string message) {
    if (echo_) {
        fmt::print(stderr, "[costumemaster] {}: {} {}\n", severity_name(severity), title, message);
    }
    entries_.push_back({severity, std::move(title), std::move(message)});
}

size_t DiagnosticLog::count(Severity severity) const {
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                             [severity](const Diagnostic& d) { return d.severity == severity; }));
}

} // namespace costumemaster
