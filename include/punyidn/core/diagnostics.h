#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace punyidn::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// One conversion step. label_index is only set for events tied to a label.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string domain;
    std::optional<std::size_t> label_index;
    std::string label;
    std::string message;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects conversion events. Not synchronized; share one emitter between
// threads only behind the caller's own lock.
class DiagnosticEmitter {
public:
    void emit(DiagnosticEvent event);
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_for_label(std::size_t label_index) const;

    bool has_errors() const;
    const DiagnosticEvent* last_error() const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace punyidn::core
