#pragma once

#include <string>
#include <utility>
#include "core/config/session_id.hpp"

namespace tollgate::core::config {

// Per-session state handed to the tool host. The interactive flag is decided
// once at process start and copied here; it is not synchronized, so sessions
// that run concurrently in one process must each carry their own context.
class SessionContext {
public:
    explicit SessionContext(bool interactive = true,
                            std::string session_id = generate_session_id())
        : interactive_(interactive), session_id_(std::move(session_id)) {}

    bool interactive() const { return interactive_; }
    const std::string& session_id() const { return session_id_; }

private:
    bool interactive_;
    std::string session_id_;
};

}  // namespace tollgate::core::config
