#include "core/execution_types.hpp"

namespace autom8_tui {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::IDLE: return "Idle";
        case SessionState::RUNNING: return "Running";
        case SessionState::SUCCEEDED: return "Succeeded";
        case SessionState::FAILED: return "Failed";
        case SessionState::CANCELLED: return "Cancelled";
    }
    return "Unknown";
}

std::chrono::milliseconds ExecutionSession::duration() const {
    if (state == SessionState::IDLE) {
        return std::chrono::milliseconds(0);
    }
    auto end = is_terminal() ? finished_at : std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at);
}

} // namespace autom8_tui
