#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::domain {

// --- Workflow state ---------------------------------------------------------

enum class WorkflowState {
    Idle      = 0,
    Starting  = 1,
    Running   = 2,
    Suspended = 3,
    Completed = 4,
    Cancelled = 5,
    Failed    = 6
};

enum class SuspendReason {
    None              = 0,
    SelectionRequired = 1,
    ApprovalRequired  = 2
};

enum class FailureReason {
    None                  = 0,
    SpawnFailed           = 1,
    UnexpectedExit        = 2,
    WorkerExitedWithError = 3
};

struct GenerationInfo {
    int current{0};
    int total{0};
};

// Everything the UI needs to render the run state.
struct WorkflowStatus {
    WorkflowState  state{WorkflowState::Idle};
    SuspendReason  suspendReason{SuspendReason::None};
    FailureReason  failure{FailureReason::None};

    std::optional<std::string> stage;
    std::optional<std::string> message;
    int                        progress{0};

    std::optional<std::string> error;
    // Set when the last decision could not be delivered and must be retried.
    bool                       handshakeFailed{false};

    GenerationInfo generation;

    bool isTerminal() const noexcept {
        return state == WorkflowState::Completed ||
               state == WorkflowState::Cancelled ||
               state == WorkflowState::Failed;
    }

    bool isSuspended(SuspendReason reason) const noexcept {
        return state == WorkflowState::Suspended && suspendReason == reason;
    }

    bool isBusy() const noexcept {
        return state == WorkflowState::Starting ||
               state == WorkflowState::Running ||
               state == WorkflowState::Suspended;
    }
};

// --- Events decoded from worker output --------------------------------------

struct StageChangeEvent {
    std::string stage;
    std::string message;
    int         progress{0};
};

struct SelectionRequiredEvent {
    std::vector<Job> rankedJobs;
};

struct ApprovalRequiredEvent {
    std::vector<GeneratedApplication> applications;
};

struct FinalResultsEvent {
    std::vector<Job> jobs;
};

struct HeartbeatEvent {};

// Structured line with a `type` this client does not know.
struct UnknownEvent {
    std::string type;
};

// Anything that is not a JSON object.
struct PlainTextLine {
    std::string text;
    bool        noisy{false};
};

using WorkflowEvent = std::variant<StageChangeEvent,
                                   SelectionRequiredEvent,
                                   ApprovalRequiredEvent,
                                   FinalResultsEvent,
                                   HeartbeatEvent,
                                   UnknownEvent,
                                   PlainTextLine>;

// --- Helpers ----------------------------------------------------------------

// Library warnings the worker prints on every run; not worth a log line.
inline bool isNoisyDiagnostic(const std::string& text) {
    static const char* const kNoise[] = {"urllib3", "NotOpenSSLWarning"};
    for (const char* needle : kNoise) {
        if (text.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

inline std::string to_string(WorkflowState s) {
    switch (s) {
        case WorkflowState::Idle:      return "Idle";
        case WorkflowState::Starting:  return "Starting";
        case WorkflowState::Running:   return "Running";
        case WorkflowState::Suspended: return "Suspended";
        case WorkflowState::Completed: return "Completed";
        case WorkflowState::Cancelled: return "Cancelled";
        case WorkflowState::Failed:    return "Failed";
    }
    return "Unknown";
}

inline std::string to_string(SuspendReason r) {
    switch (r) {
        case SuspendReason::None:              return "";
        case SuspendReason::SelectionRequired: return "SelectionRequired";
        case SuspendReason::ApprovalRequired:  return "ApprovalRequired";
    }
    return "";
}

inline std::string to_string(FailureReason r) {
    switch (r) {
        case FailureReason::None:                  return "";
        case FailureReason::SpawnFailed:           return "SpawnFailed";
        case FailureReason::UnexpectedExit:        return "UnexpectedExit";
        case FailureReason::WorkerExitedWithError: return "WorkerExitedWithError";
    }
    return "";
}

} // namespace jh::client::domain
