#pragma once

#include <chrono>
#include <functional>
#include <string>

#include "app/WorkerCommand.hpp"

namespace jh::client::app {

enum class ProcessState {
    NotStarted  = 0,
    Running     = 1,
    Terminating = 2,
    Exited      = 3
};

enum class SpawnError {
    None           = 0,
    AlreadyRunning = 1,
    FailedToStart  = 2
};

struct SpawnResult {
    bool        ok{false};
    SpawnError  error{SpawnError::None};
    std::string message;
};

struct WorkerProcessCallbacks {
    // One complete stdout line, in the order the worker wrote it.
    std::function<void(const std::string&)> onStdoutLine;
    std::function<void(const std::string&)> onStderrLine;
    std::function<void(int exitCode, bool crashed)> onExited;
};

// Fixed grace period between the polite cancel message and the forced kill.
inline constexpr std::chrono::milliseconds kForceKillGrace{2000};

// Port/interface for the single supervised worker process.
// Implementations live in infra (QProcess).
class IWorkerProcess {
public:
    virtual ~IWorkerProcess() = default;

    virtual void setCallbacks(WorkerProcessCallbacks callbacks) = 0;

    // Fails with AlreadyRunning while a process is Running or Terminating.
    virtual SpawnResult spawn(const WorkerCommand& command) = 0;

    // Writes {"type":"cancel"} to stdin (best effort), then unconditionally
    // schedules forceTerminate(kForceKillGrace).
    virtual void cancel() = 0;

    // Kills the child and every process matching the command's kill pattern
    // after `afterDelay`.
    virtual void forceTerminate(std::chrono::milliseconds afterDelay) = 0;

    virtual ProcessState state() const = 0;

    // True only for a live handle that may receive handshake messages.
    bool isActive() const {
        return state() == ProcessState::Running;
    }
};

inline std::string to_string(ProcessState s) {
    switch (s) {
        case ProcessState::NotStarted:  return "NotStarted";
        case ProcessState::Running:     return "Running";
        case ProcessState::Terminating: return "Terminating";
        case ProcessState::Exited:      return "Exited";
    }
    return "Unknown";
}

} // namespace jh::client::app
