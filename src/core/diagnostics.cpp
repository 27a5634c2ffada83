#include <asciidoc/core/diagnostics.h>

#include <algorithm>
#include <iterator>
#include <sstream>

namespace asciidoc::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_location(const SourceLocation& location) {
    std::ostringstream oss;
    oss << (location.file.empty() ? "<input>" : location.file);
    if (location.line > 0) {
        oss << ":" << location.line;
        if (location.column > 0) {
            oss << ":" << location.column;
        }
    }
    return oss.str();
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (!event.location.file.empty() || event.location.line > 0) {
        oss << " (" << format_location(event.location) << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             const SourceLocation& location) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, module, stage,
                          message, location};
    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
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

namespace {

template<typename Predicate>
std::vector<DiagnosticEvent> select_events(const std::vector<DiagnosticEvent>& events,
                                           Predicate predicate) {
    std::vector<DiagnosticEvent> selected;
    std::copy_if(events.begin(), events.end(), std::back_inserter(selected), predicate);
    return selected;
}

}  // namespace

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select_events(events_, [severity](const DiagnosticEvent& event) {
        return event.severity == severity;
    });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select_events(events_, [&module](const DiagnosticEvent& event) {
        return event.module == module;
    });
}

bool DiagnosticEmitter::has_errors() const {
    return std::any_of(events_.begin(), events_.end(), [](const DiagnosticEvent& event) {
        return event.severity == Severity::Error;
    });
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

void FailureTrace::add_snapshot(const std::string& key, const std::string& value) {
    snapshots.push_back({key, value});
}

std::string FailureTrace::format() const {
    std::ostringstream out;
    out << "FailureTrace\n"
        << "  module: " << module << '\n'
        << "  stage: " << stage << '\n'
        << "  at: " << format_location(location) << '\n'
        << "  error: " << error_message << '\n';
    if (!snapshots.empty()) {
        out << "  snapshots:\n";
        for (const auto& snapshot : snapshots) {
            out << "    " << snapshot.key << '=' << snapshot.value << '\n';
        }
    }
    if (!context_events.empty()) {
        out << "  context_events: " << context_events.size() << '\n';
        for (const auto& event : context_events) {
            out << "    " << format_diagnostic(event) << '\n';
        }
    }
    return out.str();
}

FailureTrace FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                            const std::string& module,
                                            const std::string& stage,
                                            const std::string& error_message,
                                            const SourceLocation& location) {
    FailureTrace trace{module, stage, error_message, location, emitter.events(), {}};
    traces_.push_back(trace);
    return trace;
}

const std::vector<FailureTrace>& FailureTraceCollector::traces() const {
    return traces_;
}

void FailureTraceCollector::clear() {
    traces_.clear();
}

std::size_t FailureTraceCollector::size() const {
    return traces_.size();
}

}  // namespace asciidoc::core
