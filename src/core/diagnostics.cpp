#include <punyidn/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace punyidn::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

// [error] idna/to_unicode label[1] "xn--abc!": message
std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.label_index.has_value()) {
        oss << " label[" << *event.label_index << "]";
        if (!event.label.empty()) {
            oss << " \"" << event.label << "\"";
        }
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(DiagnosticEvent event) {
    if (event.severity < min_severity_) {
        return;
    }

    if (event.timestamp == std::chrono::steady_clock::time_point{}) {
        event.timestamp = std::chrono::steady_clock::now();
    }
    events_.push_back(std::move(event));

    for (const auto& observer : observers_) {
        observer(events_.back());
    }
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    DiagnosticEvent event;
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    emit(std::move(event));
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_for_label(std::size_t label_index) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.label_index == label_index) {
            result.push_back(e);
        }
    }
    return result;
}

bool DiagnosticEmitter::has_errors() const {
    return last_error() != nullptr;
}

const DiagnosticEvent* DiagnosticEmitter::last_error() const {
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
        if (it->severity == Severity::Error) {
            return &*it;
        }
    }
    return nullptr;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace punyidn::core
