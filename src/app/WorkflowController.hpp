#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/IJobCacheClient.hpp"
#include "domain/app_config.hpp"
#include "domain/domain_model.hpp"
#include "domain/workflow_model.hpp"

namespace jh::client::app {

class IDraftRepository;
class IHandshakeChannel;
class IWorkerProcess;
class JobMutationCommand;
class JobRecordStore;
struct ApplicationStatusResult;
struct DraftSaveResult;
struct HandshakeResult;

enum class NoticeLevel {
    Info    = 0,
    Success = 1,
    Warning = 2,
    Error   = 3
};

struct WorkflowCallbacks {
    std::function<void(const jh::client::domain::WorkflowStatus&)>   onStatusChanged;
    std::function<void(const std::vector<jh::client::domain::Job>&)> onJobsChanged;
    std::function<void(const std::string&)>                          onLogAppended;
    std::function<void()>                                            onLogsCleared;
    std::function<void(NoticeLevel, const std::string&)>             onNotice;
    std::function<void(const jh::client::domain::RunConfig&)>        onConfigChanged;

    // Decision requests. `error` is set when a previous attempt failed and
    // the same decision is presented again.
    std::function<void(const std::vector<jh::client::domain::Job>&,
                       const std::optional<std::string>& error)>     onSelectionRequired;
    std::function<void(const std::vector<jh::client::domain::GeneratedApplication>&,
                       const std::optional<std::string>& error)>     onApprovalRequired;

    std::function<void(const std::optional<jh::client::domain::ConfirmationRequest>&)>
        onConfirmationChanged;

    std::function<void(const jh::client::domain::ApplicationStatusMap&)> onApplicationStatusChanged;
};

// Owns the run state of one interactive search.
//
// Commands and worker input are queued and handled one at a time, so a
// callback that calls back into the controller runs after the current
// transition has finished. Asynchronous completions (handshake, drafts)
// carry the run id they were issued under and are dropped once the run
// has been cancelled or reset.
class WorkflowController {
public:
    WorkflowController(JobRecordStore& store,
                       IWorkerProcess& process,
                       IHandshakeChannel& handshake,
                       IDraftRepository* drafts = nullptr,
                       IJobCacheClient* jobCache = nullptr,
                       jh::client::domain::WorkerSettings workerSettings = {});
    ~WorkflowController();

    WorkflowController(const WorkflowController&) = delete;
    WorkflowController& operator=(const WorkflowController&) = delete;

    void setCallbacks(WorkflowCallbacks callbacks);

    // --- Run control -------------------------------------------------------
    void start(const jh::client::domain::RunConfig& config);
    void cancel();
    void submitSelection(const std::vector<jh::client::domain::JobId>& jobIds);
    void submitApproval(const std::vector<jh::client::domain::ApprovalItem>& items);

    // Manual job path: review letters drafted outside a worker run.
    void presentApplications(const std::vector<jh::client::domain::GeneratedApplication>& apps);

    void resetSearchConfig();
    void resetAll();
    void returnToIdle();

    // --- Worker input ------------------------------------------------------
    void handleWorkerEvent(const jh::client::domain::WorkflowEvent& event,
                           const std::string& rawLine);
    void handleStderrLine(const std::string& line);
    void handleProcessExit(int exitCode, bool crashed);

    // --- Job management ----------------------------------------------------
    void loadPersistedJobs();
    void hideJob(const jh::client::domain::JobId& id);
    void unhideJob(const jh::client::domain::JobId& id);
    void deleteJob(const jh::client::domain::JobId& id);

    void requestDeleteConfirmation(const jh::client::domain::JobId& id, const std::string& label);
    void confirmPendingAction();
    void cancelPendingAction();

    void clearPersistedJobs();
    void removeDuplicateJobs();

    // Asks the drafts service which stored jobs already have a letter. Also
    // issued automatically whenever the job collection changes.
    void refreshApplicationStatus();

    jh::client::domain::Retention retention() const;
    void setRetention(jh::client::domain::Retention retention);

    // --- Accessors ---------------------------------------------------------
    const jh::client::domain::RunConfig& config() const noexcept { return config_; }
    void setConfig(const jh::client::domain::RunConfig& config);

    const jh::client::domain::WorkflowStatus& status() const noexcept { return status_; }
    const std::vector<jh::client::domain::Job>& jobs() const;
    const std::vector<std::string>& logs() const noexcept { return logs_; }
    const std::vector<jh::client::domain::Job>& rankedJobs() const noexcept { return rankedJobs_; }
    const std::vector<jh::client::domain::GeneratedApplication>& generatedApplications() const noexcept {
        return applications_;
    }
    const std::optional<jh::client::domain::ConfirmationRequest>& pendingConfirmation() const noexcept {
        return pendingConfirmation_;
    }
    const jh::client::domain::ApplicationStatusMap& applicationStatus() const noexcept {
        return applicationStatus_;
    }
    std::optional<jh::client::domain::TimePoint> lastHeartbeat() const noexcept {
        return lastHeartbeat_;
    }

    // Drafting progress encoded in stage messages, e.g. "2/5 Entwürfe generiert".
    static std::optional<jh::client::domain::GenerationInfo> generationFromMessage(
        const std::string& message,
        jh::client::domain::GenerationInfo current);

private:
    void post(std::function<void()> fn);

    void doStart(const jh::client::domain::RunConfig& config);
    void doCancel();
    void doSubmitSelection(const std::vector<jh::client::domain::JobId>& jobIds);
    void doSubmitApproval(const std::vector<jh::client::domain::ApprovalItem>& items);
    void doReset(bool clearEverything);

    void onStageChange(const jh::client::domain::StageChangeEvent& e);
    void onSelectionRequired(const jh::client::domain::SelectionRequiredEvent& e);
    void onApprovalRequired(const jh::client::domain::ApprovalRequiredEvent& e);
    void onFinalResults(const jh::client::domain::FinalResultsEvent& e);

    void onSelectionDelivered(std::uint64_t runId, const HandshakeResult& result);
    void onApprovalDelivered(std::uint64_t runId, const HandshakeResult& result);
    void onDraftsSaved(std::uint64_t runId, const DraftSaveResult& result);

    void requestApplicationStatus();
    void onApplicationStatusLoaded(std::uint64_t requestId, const ApplicationStatusResult& result);
    void setApplicationStatus(jh::client::domain::ApplicationStatusMap statuses);

    void runMutation(JobCacheAction action, const jh::client::domain::JobId& id);
    void onMutationSynced(std::uint64_t storeEpoch,
                          const std::shared_ptr<JobMutationCommand>& command,
                          JobCacheOutcome outcome);

    void enterSuspended(jh::client::domain::SuspendReason reason,
                        const std::optional<std::string>& error);
    void enterFailed(jh::client::domain::FailureReason reason, const std::string& error);
    void clearDecisionState();
    void stopWorkerNow();

    void appendLog(const std::string& line);
    void clearLogs();
    void emitStatus();
    void emitJobs();
    void notify(NoticeLevel level, const std::string& text);

    JobRecordStore&                   store_;
    IWorkerProcess&                   process_;
    IHandshakeChannel&                handshake_;
    IDraftRepository*                 drafts_;
    IJobCacheClient*                  jobCache_;
    jh::client::domain::WorkerSettings workerSettings_;

    WorkflowCallbacks                 callbacks_;

    jh::client::domain::RunConfig      config_;
    jh::client::domain::WorkflowStatus status_;
    std::vector<std::string>           logs_;

    std::vector<jh::client::domain::Job>                  rankedJobs_;
    std::vector<jh::client::domain::GeneratedApplication> applications_;
    std::optional<jh::client::domain::ConfirmationRequest> pendingConfirmation_;
    std::optional<jh::client::domain::TimePoint>          lastHeartbeat_;
    jh::client::domain::ApplicationStatusMap              applicationStatus_;

    std::uint64_t runId_{0};
    std::uint64_t storeEpoch_{0};
    // Only the reply to the latest status request is applied.
    std::uint64_t statusRequestId_{0};

    std::deque<std::function<void()>> queue_;
    bool                              dispatching_{false};
};

inline std::string to_string(NoticeLevel level) {
    switch (level) {
        case NoticeLevel::Info:    return "info";
        case NoticeLevel::Success: return "success";
        case NoticeLevel::Warning: return "warning";
        case NoticeLevel::Error:   return "error";
    }
    return "info";
}

} // namespace jh::client::app
