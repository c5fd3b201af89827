#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace tollgate::audit {

// Fixed vocabulary shared with the UI/telemetry collaborator.
enum class EventKind {
    Bash,
    Read,
    Write,
    Edit,
    Glob,
    Grep,
    Package,
    Diff,
    Code,
    FileChanged,
    Warning,
    Question,
    AutoAnswer
};

std::string to_string(EventKind kind);

// Audit emission is fire-and-forget: sinks never report failure to the caller.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void emit(EventKind kind, const std::string& message) = 0;

    // max_lines bounds rendering only; 0 means unbounded.
    virtual void emit_block(EventKind kind, const std::string& label,
                            const std::string& body, std::size_t max_lines) = 0;
};

class NullEventSink : public EventSink {
public:
    void emit(EventKind, const std::string&) override {}
    void emit_block(EventKind, const std::string&, const std::string&,
                    std::size_t) override {}
};

// Renders events through the process logger.
class LogEventSink : public EventSink {
public:
    void emit(EventKind kind, const std::string& message) override;
    void emit_block(EventKind kind, const std::string& label,
                    const std::string& body, std::size_t max_lines) override;
};

class CompositeEventSink : public EventSink {
public:
    void add(std::shared_ptr<EventSink> sink);

    void emit(EventKind kind, const std::string& message) override;
    void emit_block(EventKind kind, const std::string& label,
                    const std::string& body, std::size_t max_lines) override;

private:
    std::vector<std::shared_ptr<EventSink>> sinks_;
};

// Splits on '\n' without producing a trailing empty line.
std::vector<std::string> split_lines(const std::string& text);

}  // namespace tollgate::audit
