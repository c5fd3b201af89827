#include "audit/event_sink.hpp"

#include <sstream>
#include <utility>
#include "core/logging/logger.hpp"

namespace tollgate::audit {

std::string to_string(const EventKind kind) {
    switch (kind) {
        case EventKind::Bash:
            return "bash";
        case EventKind::Read:
            return "read";
        case EventKind::Write:
            return "write";
        case EventKind::Edit:
            return "edit";
        case EventKind::Glob:
            return "glob";
        case EventKind::Grep:
            return "grep";
        case EventKind::Package:
            return "package";
        case EventKind::Diff:
            return "diff";
        case EventKind::Code:
            return "code";
        case EventKind::FileChanged:
            return "file_changed";
        case EventKind::Warning:
            return "warning";
        case EventKind::Question:
            return "question";
        case EventKind::AutoAnswer:
            return "auto_answer";
        default:
            return "unknown";
    }
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

void LogEventSink::emit(const EventKind kind, const std::string& message) {
    const std::string line = "{" + to_string(kind) + "} " + message;
    if (kind == EventKind::Warning) {
        LOG_WARN(line);
        return;
    }
    LOG_INFO(line);
}

void LogEventSink::emit_block(const EventKind kind, const std::string& label,
                              const std::string& body,
                              const std::size_t max_lines) {
    const std::string tag = "{" + to_string(kind) + "} ";
    auto lines = split_lines(body);
    if (max_lines > 0 && lines.size() > max_lines) {
        const std::size_t hidden = lines.size() - max_lines;
        lines.resize(max_lines);
        lines.push_back("... [" + std::to_string(hidden) + " more lines]");
    }

    std::ostringstream out;
    out << tag << "┌── " << label;
    for (const auto& line : lines) {
        out << "\n" << tag << " │ " << line;
    }
    out << "\n" << tag << "└──";
    LOG_INFO(out.str());
}

void CompositeEventSink::add(std::shared_ptr<EventSink> sink) {
    if (sink) {
        sinks_.push_back(std::move(sink));
    }
}

void CompositeEventSink::emit(const EventKind kind, const std::string& message) {
    for (const auto& sink : sinks_) {
        sink->emit(kind, message);
    }
}

void CompositeEventSink::emit_block(const EventKind kind, const std::string& label,
                                    const std::string& body,
                                    const std::size_t max_lines) {
    for (const auto& sink : sinks_) {
        sink->emit_block(kind, label, body, max_lines);
    }
}

}  // namespace tollgate::audit
