#include "app/WorkflowController.hpp"

#include <QDebug>
#include <QRegularExpression>
#include <QString>

#include <utility>

#include "app/IDraftRepository.hpp"
#include "app/IHandshakeChannel.hpp"
#include "app/IWorkerProcess.hpp"
#include "app/JobMutationCommand.hpp"
#include "app/JobRecordStore.hpp"
#include "app/WorkerCommand.hpp"

namespace jh::client::app {

using namespace jh::client::domain;

namespace {

const char* const kDraftingStage = "Bewerbungserstellung";

constexpr int kProgressSelectionSubmitted = 70;
constexpr int kProgressApprovalSubmitted  = 90;
constexpr int kProgressDone               = 100;

inline QString q(const std::string& s) {
    return QString::fromStdString(s);
}

const char* pastTense(JobCacheAction action) {
    switch (action) {
        case JobCacheAction::Hide:   return "hidden";
        case JobCacheAction::Unhide: return "shown again";
        case JobCacheAction::Delete: return "deleted";
    }
    return "";
}

} // namespace

WorkflowController::WorkflowController(JobRecordStore& store,
                                       IWorkerProcess& process,
                                       IHandshakeChannel& handshake,
                                       IDraftRepository* drafts,
                                       IJobCacheClient* jobCache,
                                       WorkerSettings workerSettings)
    : store_(store)
    , process_(process)
    , handshake_(handshake)
    , drafts_(drafts)
    , jobCache_(jobCache)
    , workerSettings_(std::move(workerSettings))
    , config_(defaultRunConfig()) {
}

WorkflowController::~WorkflowController() = default;

void WorkflowController::setCallbacks(WorkflowCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

void WorkflowController::post(std::function<void()> fn) {
    queue_.push_back(std::move(fn));
    if (dispatching_) {
        return;
    }

    dispatching_ = true;
    while (!queue_.empty()) {
        auto next = std::move(queue_.front());
        queue_.pop_front();
        next();
    }
    dispatching_ = false;
}

// --- Notifications -----------------------------------------------------------

void WorkflowController::emitStatus() {
    if (callbacks_.onStatusChanged) {
        callbacks_.onStatusChanged(status_);
    }
}

void WorkflowController::emitJobs() {
    if (callbacks_.onJobsChanged) {
        callbacks_.onJobsChanged(store_.jobs());
    }
    requestApplicationStatus();
}

void WorkflowController::notify(NoticeLevel level, const std::string& text) {
    if (level == NoticeLevel::Error || level == NoticeLevel::Warning) {
        qWarning() << "Notice:" << q(text);
    }
    if (callbacks_.onNotice) {
        callbacks_.onNotice(level, text);
    }
}

void WorkflowController::appendLog(const std::string& line) {
    logs_.push_back(line);
    if (callbacks_.onLogAppended) {
        callbacks_.onLogAppended(line);
    }
}

void WorkflowController::clearLogs() {
    logs_.clear();
    if (callbacks_.onLogsCleared) {
        callbacks_.onLogsCleared();
    }
}

// --- Run control -------------------------------------------------------------

void WorkflowController::start(const RunConfig& config) {
    post([this, config] { doStart(config); });
}

void WorkflowController::doStart(const RunConfig& config) {
    if (status_.state != WorkflowState::Idle) {
        notify(NoticeLevel::Warning,
               status_.isTerminal() ? "Reset the previous search before starting a new one."
                                    : "A search is already running.");
        return;
    }

    if (auto invalid = validateRunConfig(config)) {
        notify(NoticeLevel::Warning, *invalid);
        return;
    }

    config_ = config;
    ++runId_;
    clearLogs();
    clearDecisionState();

    status_ = WorkflowStatus{};
    status_.state   = WorkflowState::Starting;
    status_.message = "Starting job search...";
    emitStatus();

    const WorkerCommand command = buildWorkerCommand(workerSettings_, config_);
    qDebug() << "Spawning worker:" << command.program << command.arguments;

    const SpawnResult spawned = process_.spawn(command);
    if (!spawned.ok) {
        status_ = WorkflowStatus{};
        status_.failure = FailureReason::SpawnFailed;
        status_.error   = spawned.message;
        emitStatus();
        notify(NoticeLevel::Error, "Could not start the job search: " + spawned.message);
        return;
    }

    status_.state   = WorkflowState::Running;
    status_.stage   = std::string("Preparing");
    status_.message = "Worker started";
    emitStatus();
}

void WorkflowController::cancel() {
    post([this] { doCancel(); });
}

void WorkflowController::doCancel() {
    if (!status_.isBusy()) {
        qDebug() << "cancel() ignored in state" << q(to_string(status_.state));
        return;
    }

    if (process_.state() == ProcessState::Running) {
        process_.cancel();
    }

    ++runId_;
    clearDecisionState();

    status_.state         = WorkflowState::Cancelled;
    status_.suspendReason = SuspendReason::None;
    status_.message       = "Search cancelled";
    status_.error.reset();
    status_.handshakeFailed = false;
    emitStatus();

    appendLog("Search cancelled by user.");
    notify(NoticeLevel::Info, "Search cancelled");
}

void WorkflowController::submitSelection(const std::vector<JobId>& jobIds) {
    post([this, jobIds] { doSubmitSelection(jobIds); });
}

void WorkflowController::doSubmitSelection(const std::vector<JobId>& jobIds) {
    if (!status_.isSuspended(SuspendReason::SelectionRequired)) {
        qWarning() << "submitSelection rejected in state" << q(to_string(status_.state));
        notify(NoticeLevel::Warning, "No job selection is pending.");
        return;
    }

    status_.state           = WorkflowState::Running;
    status_.suspendReason   = SuspendReason::None;
    status_.stage           = std::string("Processing selection");
    status_.message         = "Generating applications for " + std::to_string(jobIds.size()) + " jobs...";
    status_.progress        = kProgressSelectionSubmitted;
    status_.error.reset();
    status_.handshakeFailed = false;
    status_.generation      = GenerationInfo{0, static_cast<int>(jobIds.size())};
    emitStatus();

    appendLog("Submitting selection of " + std::to_string(jobIds.size()) + " jobs.");

    const auto run = runId_;
    handshake_.sendSelection(jobIds, [this, run](const HandshakeResult& result) {
        post([this, run, result] { onSelectionDelivered(run, result); });
    });
}

void WorkflowController::onSelectionDelivered(std::uint64_t runId, const HandshakeResult& result) {
    if (runId != runId_) {
        qDebug() << "Dropping selection result of a previous run";
        return;
    }

    if (result.ok) {
        appendLog("Selection delivered to worker.");
        return;
    }

    if (status_.state != WorkflowState::Running) {
        qDebug() << "Selection failed after the run moved on to" << q(to_string(status_.state));
        return;
    }

    const std::string error = "Job selection could not be delivered: " + result.message;
    status_.handshakeFailed = true;
    enterSuspended(SuspendReason::SelectionRequired, error);
    notify(NoticeLevel::Error, error);
}

void WorkflowController::submitApproval(const std::vector<ApprovalItem>& items) {
    post([this, items] { doSubmitApproval(items); });
}

void WorkflowController::doSubmitApproval(const std::vector<ApprovalItem>& items) {
    if (!status_.isSuspended(SuspendReason::ApprovalRequired)) {
        qWarning() << "submitApproval rejected in state" << q(to_string(status_.state));
        notify(NoticeLevel::Warning, "No application approval is pending.");
        return;
    }

    const bool offline = !process_.isActive();

    status_.state           = WorkflowState::Running;
    status_.suspendReason   = SuspendReason::None;
    status_.stage           = std::string(offline ? "Saving drafts" : "Finalizing applications");
    status_.message         = "Processing " + std::to_string(items.size()) + " approved applications...";
    status_.progress        = kProgressApprovalSubmitted;
    status_.error.reset();
    status_.handshakeFailed = false;
    emitStatus();

    const auto run = runId_;

    if (offline) {
        if (!drafts_) {
            enterSuspended(SuspendReason::ApprovalRequired,
                           std::string("No drafts service is configured."));
            notify(NoticeLevel::Error, "No drafts service is configured.");
            return;
        }
        appendLog("No active worker: saving " + std::to_string(items.size()) + " drafts.");
        drafts_->saveDrafts(items, [this, run](const DraftSaveResult& result) {
            post([this, run, result] { onDraftsSaved(run, result); });
        });
        return;
    }

    appendLog("Submitting approval of " + std::to_string(items.size()) + " applications.");
    handshake_.sendApproval(items, [this, run](const HandshakeResult& result) {
        post([this, run, result] { onApprovalDelivered(run, result); });
    });
}

void WorkflowController::onApprovalDelivered(std::uint64_t runId, const HandshakeResult& result) {
    if (runId != runId_) {
        qDebug() << "Dropping approval result of a previous run";
        return;
    }

    if (result.ok) {
        appendLog("Approval delivered to worker.");
        applications_.clear();
        return;
    }

    if (status_.state != WorkflowState::Running) {
        qDebug() << "Approval failed after the run moved on to" << q(to_string(status_.state));
        return;
    }

    const std::string error = "Approval could not be delivered: " + result.message;
    status_.handshakeFailed = true;
    enterSuspended(SuspendReason::ApprovalRequired, error);
    notify(NoticeLevel::Error, error);
}

void WorkflowController::onDraftsSaved(std::uint64_t runId, const DraftSaveResult& result) {
    if (runId != runId_) {
        qDebug() << "Dropping drafts result of a previous run";
        return;
    }

    if (!result.ok) {
        const std::string error = "Drafts could not be saved: " + result.message;
        enterSuspended(SuspendReason::ApprovalRequired, error);
        notify(NoticeLevel::Error, error);
        return;
    }

    clearDecisionState();
    status_.state    = WorkflowState::Completed;
    status_.progress = kProgressDone;
    status_.message  = std::to_string(result.saved) + " applications saved as drafts";
    emitStatus();

    appendLog(*status_.message);
    notify(NoticeLevel::Success, *status_.message);
}

void WorkflowController::presentApplications(const std::vector<GeneratedApplication>& apps) {
    post([this, apps] {
        const bool idleLike = status_.state == WorkflowState::Idle || status_.isTerminal();
        if (!idleLike || process_.isActive()) {
            notify(NoticeLevel::Warning, "Finish or cancel the running search first.");
            return;
        }
        if (apps.empty()) {
            notify(NoticeLevel::Warning, "There are no applications to review.");
            return;
        }

        ++runId_;
        status_ = WorkflowStatus{};
        status_.generation = GenerationInfo{static_cast<int>(apps.size()), static_cast<int>(apps.size())};
        status_.stage      = std::string("Review");
        status_.message    = "Review " + std::to_string(apps.size()) + " applications";
        status_.progress   = kProgressApprovalSubmitted;
        applications_      = apps;
        enterSuspended(SuspendReason::ApprovalRequired, std::nullopt);
    });
}

void WorkflowController::resetSearchConfig() {
    post([this] { doReset(false); });
}

void WorkflowController::resetAll() {
    post([this] { doReset(true); });
}

void WorkflowController::doReset(bool clearEverything) {
    stopWorkerNow();

    ++runId_;
    clearDecisionState();

    RunConfig fresh = defaultRunConfig();
    if (!clearEverything) {
        fresh.providers = config_.providers;
    }
    config_ = fresh;

    status_ = WorkflowStatus{};

    if (clearEverything) {
        ++storeEpoch_;
        store_.clear();
        clearLogs();
        cancelPendingAction();
        emitJobs();
    }

    emitStatus();
    if (callbacks_.onConfigChanged) {
        callbacks_.onConfigChanged(config_);
    }
    qDebug() << (clearEverything ? "Full reset" : "Search configuration reset");
}

void WorkflowController::returnToIdle() {
    post([this] {
        if (!status_.isTerminal()) {
            qDebug() << "returnToIdle() ignored in state" << q(to_string(status_.state));
            return;
        }
        ++runId_;
        clearDecisionState();
        status_ = WorkflowStatus{};
        emitStatus();
    });
}

void WorkflowController::stopWorkerNow() {
    const auto state = process_.state();
    if (state == ProcessState::Running || state == ProcessState::Terminating) {
        process_.forceTerminate(std::chrono::milliseconds(0));
    }
}

void WorkflowController::setConfig(const RunConfig& config) {
    config_ = config;
}

// --- State helpers -----------------------------------------------------------

void WorkflowController::enterSuspended(SuspendReason reason, const std::optional<std::string>& error) {
    status_.state         = WorkflowState::Suspended;
    status_.suspendReason = reason;
    status_.error         = error;
    emitStatus();

    if (reason == SuspendReason::SelectionRequired && callbacks_.onSelectionRequired) {
        callbacks_.onSelectionRequired(rankedJobs_, error);
    } else if (reason == SuspendReason::ApprovalRequired && callbacks_.onApprovalRequired) {
        callbacks_.onApprovalRequired(applications_, error);
    }
}

void WorkflowController::enterFailed(FailureReason reason, const std::string& error) {
    ++runId_;
    clearDecisionState();

    status_.state         = WorkflowState::Failed;
    status_.suspendReason = SuspendReason::None;
    status_.failure       = reason;
    status_.error         = error;
    emitStatus();

    appendLog(error);
    notify(NoticeLevel::Error, error);
}

void WorkflowController::clearDecisionState() {
    rankedJobs_.clear();
    applications_.clear();
}

// --- Worker input ------------------------------------------------------------

void WorkflowController::handleWorkerEvent(const WorkflowEvent& event, const std::string& rawLine) {
    post([this, event, rawLine] {
        if (const auto* text = std::get_if<PlainTextLine>(&event)) {
            if (!text->noisy) {
                appendLog(text->text);
            }
            return;
        }

        appendLog(rawLine);

        if (const auto* e = std::get_if<StageChangeEvent>(&event)) {
            onStageChange(*e);
        } else if (const auto* e = std::get_if<SelectionRequiredEvent>(&event)) {
            onSelectionRequired(*e);
        } else if (const auto* e = std::get_if<ApprovalRequiredEvent>(&event)) {
            onApprovalRequired(*e);
        } else if (const auto* e = std::get_if<FinalResultsEvent>(&event)) {
            onFinalResults(*e);
        } else if (std::holds_alternative<HeartbeatEvent>(event)) {
            lastHeartbeat_ = Clock::now();
        } else if (const auto* e = std::get_if<UnknownEvent>(&event)) {
            qDebug() << "Ignoring worker event of unknown type" << q(e->type);
        }
    });
}

void WorkflowController::handleStderrLine(const std::string& line) {
    post([this, line] {
        if (line.empty() || isNoisyDiagnostic(line)) {
            return;
        }
        appendLog("[stderr] " + line);
    });
}

void WorkflowController::handleProcessExit(int exitCode, bool crashed) {
    post([this, exitCode, crashed] {
        qDebug() << "Worker exited, code" << exitCode << "crashed" << crashed
                 << "state" << q(to_string(status_.state));

        switch (status_.state) {
            case WorkflowState::Suspended:
                enterFailed(FailureReason::UnexpectedExit,
                            "The worker exited while waiting for your decision (exit code " +
                                std::to_string(exitCode) + ").");
                return;

            case WorkflowState::Starting:
            case WorkflowState::Running:
                if (exitCode == 0 && !crashed) {
                    ++runId_;
                    clearDecisionState();
                    status_.state    = WorkflowState::Completed;
                    status_.progress = kProgressDone;
                    status_.message  = "Job search finished";
                    emitStatus();
                    notify(NoticeLevel::Success, "Job search finished");
                } else {
                    enterFailed(FailureReason::WorkerExitedWithError,
                                crashed ? std::string("The worker crashed.")
                                        : "The worker exited with code " + std::to_string(exitCode) + ".");
                }
                return;

            case WorkflowState::Idle:
            case WorkflowState::Completed:
            case WorkflowState::Cancelled:
            case WorkflowState::Failed:
                return;
        }
    });
}

void WorkflowController::onStageChange(const StageChangeEvent& e) {
    if (status_.state != WorkflowState::Starting && status_.state != WorkflowState::Running) {
        qDebug() << "Stage change ignored in state" << q(to_string(status_.state));
        return;
    }

    status_.state    = WorkflowState::Running;
    status_.stage    = e.stage;
    status_.message  = e.message;
    status_.progress = e.progress;

    if (e.stage == kDraftingStage) {
        if (auto gen = generationFromMessage(e.message, status_.generation)) {
            status_.generation = *gen;
        }
    }
    emitStatus();
}

void WorkflowController::onSelectionRequired(const SelectionRequiredEvent& e) {
    if (status_.state != WorkflowState::Starting && status_.state != WorkflowState::Running) {
        qWarning() << "Selection request ignored in state" << q(to_string(status_.state));
        return;
    }

    store_.mergeIncoming(e.rankedJobs);
    emitJobs();

    rankedJobs_ = e.rankedJobs;
    status_.message         = std::to_string(rankedJobs_.size()) + " jobs found, waiting for your selection";
    status_.handshakeFailed = false;
    enterSuspended(SuspendReason::SelectionRequired, std::nullopt);
}

void WorkflowController::onApprovalRequired(const ApprovalRequiredEvent& e) {
    if (status_.state != WorkflowState::Starting && status_.state != WorkflowState::Running) {
        qWarning() << "Approval request ignored in state" << q(to_string(status_.state));
        return;
    }

    applications_ = e.applications;
    status_.generation.current = static_cast<int>(applications_.size());
    status_.message            = std::to_string(applications_.size()) + " applications drafted, waiting for approval";
    status_.handshakeFailed    = false;
    enterSuspended(SuspendReason::ApprovalRequired, std::nullopt);
}

void WorkflowController::onFinalResults(const FinalResultsEvent& e) {
    if (!status_.isBusy()) {
        qDebug() << "Final results ignored in state" << q(to_string(status_.state));
        return;
    }

    if (!e.jobs.empty()) {
        store_.mergeIncoming(e.jobs);
        emitJobs();
    }

    ++runId_;
    clearDecisionState();
    status_.state         = WorkflowState::Completed;
    status_.suspendReason = SuspendReason::None;
    status_.progress      = kProgressDone;
    status_.message       = "Search completed: " + std::to_string(e.jobs.size()) + " jobs";
    emitStatus();
    notify(NoticeLevel::Success, *status_.message);
}

std::optional<GenerationInfo> WorkflowController::generationFromMessage(const std::string& message,
                                                                        GenerationInfo current) {
    static const QRegularExpression drafted(QStringLiteral("(\\d+)/(\\d+)\\s+Entwürfe generiert"));
    static const QRegularExpression announced(QStringLiteral("Erstelle Bewerbungen für (\\d+) Jobs"));

    const QString text = q(message);

    const auto m = drafted.match(text);
    if (m.hasMatch()) {
        return GenerationInfo{m.captured(1).toInt(), m.captured(2).toInt()};
    }

    const auto a = announced.match(text);
    if (a.hasMatch()) {
        current.total = a.captured(1).toInt();
        return current;
    }
    return std::nullopt;
}

// --- Job management ----------------------------------------------------------

void WorkflowController::loadPersistedJobs() {
    post([this] {
        store_.load();
        emitJobs();
    });
}

const std::vector<Job>& WorkflowController::jobs() const {
    return store_.jobs();
}

void WorkflowController::hideJob(const JobId& id) {
    post([this, id] { runMutation(JobCacheAction::Hide, id); });
}

void WorkflowController::unhideJob(const JobId& id) {
    post([this, id] { runMutation(JobCacheAction::Unhide, id); });
}

void WorkflowController::deleteJob(const JobId& id) {
    post([this, id] { runMutation(JobCacheAction::Delete, id); });
}

void WorkflowController::runMutation(JobCacheAction action, const JobId& id) {
    auto command = std::make_shared<JobMutationCommand>(action, id);
    if (!command->apply(store_, rankedJobs_)) {
        notify(NoticeLevel::Warning, "Job " + id + " not found.");
        return;
    }
    emitJobs();

    if (!jobCache_) {
        notify(NoticeLevel::Success, std::string("Job ") + pastTense(action));
        return;
    }

    const auto epoch = storeEpoch_;
    jobCache_->send(action, id, [this, epoch, command](JobCacheOutcome outcome) {
        post([this, epoch, command, outcome] { onMutationSynced(epoch, command, outcome); });
    });
}

void WorkflowController::onMutationSynced(std::uint64_t storeEpoch,
                                          const std::shared_ptr<JobMutationCommand>& command,
                                          JobCacheOutcome outcome) {
    if (storeEpoch != storeEpoch_) {
        return;
    }

    const char* action = to_string(command->action());
    switch (outcome) {
        case JobCacheOutcome::Ok:
            qDebug() << "Job cache" << action << "ok for" << q(command->jobId());
            break;
        case JobCacheOutcome::NotFound:
            qDebug() << "Job" << q(command->jobId()) << "not in backend cache, local" << action << "only";
            break;
        case JobCacheOutcome::Unreachable:
            qWarning() << "Job cache unreachable, local" << action << "only";
            break;
        case JobCacheOutcome::Failed:
            break;
    }

    if (JobMutationCommand::shouldRollback(outcome)) {
        command->rollback(store_, rankedJobs_);
        emitJobs();
        notify(NoticeLevel::Error, std::string("Could not ") + action + " job " + command->jobId() + ".");
        return;
    }

    notify(NoticeLevel::Success, std::string("Job ") + pastTense(command->action()));
}

void WorkflowController::requestDeleteConfirmation(const JobId& id, const std::string& label) {
    post([this, id, label] {
        pendingConfirmation_ = ConfirmationRequest{ConfirmationKind::DeleteJob, id, label};
        if (callbacks_.onConfirmationChanged) {
            callbacks_.onConfirmationChanged(pendingConfirmation_);
        }
    });
}

void WorkflowController::confirmPendingAction() {
    post([this] {
        if (!pendingConfirmation_) {
            return;
        }
        const ConfirmationRequest request = *pendingConfirmation_;
        pendingConfirmation_.reset();
        if (callbacks_.onConfirmationChanged) {
            callbacks_.onConfirmationChanged(pendingConfirmation_);
        }

        switch (request.kind) {
            case ConfirmationKind::DeleteJob:
                runMutation(JobCacheAction::Delete, request.jobId);
                break;
        }
    });
}

void WorkflowController::cancelPendingAction() {
    post([this] {
        if (!pendingConfirmation_) {
            return;
        }
        pendingConfirmation_.reset();
        if (callbacks_.onConfirmationChanged) {
            callbacks_.onConfirmationChanged(pendingConfirmation_);
        }
    });
}

void WorkflowController::clearPersistedJobs() {
    post([this] {
        ++storeEpoch_;
        store_.clear();
        emitJobs();
        notify(NoticeLevel::Info, "Saved jobs cleared");
    });
}

void WorkflowController::removeDuplicateJobs() {
    post([this] {
        const auto removed = store_.removeDuplicates();
        if (removed > 0) {
            emitJobs();
        }
        notify(NoticeLevel::Info, std::to_string(removed) + " duplicate jobs removed");
    });
}

void WorkflowController::refreshApplicationStatus() {
    post([this] { requestApplicationStatus(); });
}

void WorkflowController::requestApplicationStatus() {
    if (!drafts_) {
        return;
    }

    const auto requestId = ++statusRequestId_;
    const auto& jobs     = store_.jobs();
    if (jobs.empty()) {
        setApplicationStatus({});
        return;
    }

    drafts_->fetchApplicationStatus(jobs, [this, requestId](const ApplicationStatusResult& result) {
        post([this, requestId, result] { onApplicationStatusLoaded(requestId, result); });
    });
}

void WorkflowController::onApplicationStatusLoaded(std::uint64_t requestId,
                                                   const ApplicationStatusResult& result) {
    if (requestId != statusRequestId_) {
        return;
    }
    if (!result.ok) {
        notify(NoticeLevel::Error, "Could not load application status: " + result.message);
        return;
    }
    setApplicationStatus(result.statuses);
}

void WorkflowController::setApplicationStatus(ApplicationStatusMap statuses) {
    applicationStatus_ = std::move(statuses);
    if (callbacks_.onApplicationStatusChanged) {
        callbacks_.onApplicationStatusChanged(applicationStatus_);
    }
}

Retention WorkflowController::retention() const {
    return store_.retention();
}

void WorkflowController::setRetention(Retention retention) {
    post([this, retention] {
        store_.setRetention(retention);
        qDebug() << "Storage retention set to" << q(to_string(retention));
    });
}

} // namespace jh::client::app
