#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace svgrsx::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
};

// "[warning] xml/parse: message"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void debug(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Debug, module, stage, message);
    }
    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Error, module, stage, message);
    }

    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace svgrsx::core
