#pragma once

/// @file diagnostics.hpp
/// @brief Level diagnostics: warnings and critical alerts surfaced to the player

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace costumemaster {

/// How serious a diagnostic is. Critical means the level cannot run.
enum class Severity { Info, Warning, Critical };

/// Returns the lowercase label used when echoing a diagnostic
[[nodiscard]] constexpr std::string_view severity_name(Severity severity) {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Critical:
        return "critical";
    }
    return "unknown";
}

/// A single alert: a short title plus a longer explanation of what to fix.
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string title;
    std::string message;
};

/// Ordered collection of diagnostics raised while loading or running a level.
///
/// Entries are kept in arrival order. Each report is also echoed to stderr
/// unless echo is disabled (the test suite turns it off).
class DiagnosticLog {
  public:
    DiagnosticLog() = default;
    explicit DiagnosticLog(bool echo) : echo_(echo) {}

    void report(Severity severity, std::string title, std::string message);

    void info(std::string title, std::string message) {
        report(Severity::Info, std::move(title), std::move(message));
    }
    void warning(std::string title, std::string message) {
        report(Severity::Warning, std::move(title), std::move(message));
    }
    void critical(std::string title, std::string message) {
        report(Severity::Critical, std::move(title), std::move(message));
    }

    [[nodiscard]] const std::vector<Diagnostic>& entries() const { return entries_; }
    [[nodiscard]] size_t count(Severity severity) const;
    [[nodiscard]] bool has_critical() const { return count(Severity::Critical) > 0; }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    void set_echo(bool echo) { echo_ = echo; }
    void clear() { entries_.clear(); }

  private:
    std::vector<Diagnostic> entries_;
    bool echo_ = true;
};

} // namespace costumemaster
