#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace asciidoc::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

// Source location of a diagnostic. line/column are 1-based; 0 means the
// event is not anchored to a line (include resolution, document-level).
struct SourceLocation {
    std::string file;
    int line = 0;
    int column = 0;
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    SourceLocation location;
};

const char* severity_name(Severity severity);

std::string format_location(const SourceLocation& location);
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              const SourceLocation& location = {});

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    bool has_errors() const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

struct FailureSnapshot {
    std::string key;
    std::string value;
};

// Post-mortem record of a failed conversion: the error plus every
// diagnostic emitted before it.
struct FailureTrace {
    std::string module;
    std::string stage;
    std::string error_message;
    SourceLocation location;
    std::vector<DiagnosticEvent> context_events;
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(const std::string& key, const std::string& value);
    std::string format() const;
};

class FailureTraceCollector {
public:
    FailureTrace capture(const DiagnosticEmitter& emitter,
                         const std::string& module,
                         const std::string& stage,
                         const std::string& error_message,
                         const SourceLocation& location = {});

    const std::vector<FailureTrace>& traces() const;
    void clear();
    std::size_t size() const;

private:
    std::vector<FailureTrace> traces_;
};

}  // namespace asciidoc::core
