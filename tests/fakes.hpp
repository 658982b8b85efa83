#pragma once

#include <QByteArray>
#include <QString>

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "app/IDraftRepository.hpp"
#include "app/IHandshakeChannel.hpp"
#include "app/IJobCacheClient.hpp"
#include "app/IJobStorage.hpp"
#include "app/IWorkerProcess.hpp"
#include "domain/domain_model.hpp"
#include "net/IHandshakeTransport.hpp"

namespace jh::client::test {

inline domain::Job makeJob(const std::string& id,
                           const std::string& title,
                           const std::string& company,
                           const std::string& url = {}) {
    domain::Job j;
    j.id       = id;
    j.title    = title;
    j.company  = company;
    j.url      = url;
    j.location = "Berlin";
    j.platform = "jsearch";
    return j;
}

class FakeWorkerProcess : public app::IWorkerProcess {
public:
    void setCallbacks(app::WorkerProcessCallbacks callbacks) override {
        callbacks_ = std::move(callbacks);
    }

    app::SpawnResult spawn(const app::WorkerCommand& command) override {
        ++spawnCount;
        lastCommand = command;
        if (state_ == app::ProcessState::Running || state_ == app::ProcessState::Terminating) {
            return {false, app::SpawnError::AlreadyRunning, "A worker is already running."};
        }
        if (failSpawn) {
            state_ = app::ProcessState::Exited;
            return {false, app::SpawnError::FailedToStart, "python3: not found"};
        }
        state_ = app::ProcessState::Running;
        return {true, app::SpawnError::None, {}};
    }

    void cancel() override {
        ++cancelCount;
        state_ = app::ProcessState::Terminating;
    }

    void forceTerminate(std::chrono::milliseconds afterDelay) override {
        ++forceTerminateCount;
        lastForceDelay = afterDelay;
        state_ = app::ProcessState::Exited;
    }

    app::ProcessState state() const override { return state_; }

    // Simulates the OS reporting the child gone.
    void exit() { state_ = app::ProcessState::Exited; }

    bool                      failSpawn{false};
    int                       spawnCount{0};
    int                       cancelCount{0};
    int                       forceTerminateCount{0};
    std::chrono::milliseconds lastForceDelay{-1};
    app::WorkerCommand        lastCommand;

private:
    app::WorkerProcessCallbacks callbacks_;
    app::ProcessState           state_{app::ProcessState::NotStarted};
};

// Records calls; completes them only when told to.
class FakeHandshakeChannel : public app::IHandshakeChannel {
public:
    void sendSelection(const std::vector<domain::JobId>& jobIds, app::HandshakeCallback done) override {
        selections.push_back(jobIds);
        pending = std::move(done);
        if (autoResult) {
            complete(*autoResult);
        }
    }

    void sendApproval(const std::vector<domain::ApprovalItem>& items, app::HandshakeCallback done) override {
        approvals.push_back(items);
        pending = std::move(done);
        if (autoResult) {
            complete(*autoResult);
        }
    }

    void complete(const app::HandshakeResult& result) {
        auto done = std::move(pending);
        pending   = nullptr;
        if (done) {
            done(result);
        }
    }

    std::optional<app::HandshakeResult>            autoResult;
    app::HandshakeCallback                         pending;
    std::vector<std::vector<domain::JobId>>        selections;
    std::vector<std::vector<domain::ApprovalItem>> approvals;
};

class FakeJobStorage : public app::IJobStorage {
public:
    std::optional<app::StoredJobs> loadJobs() const override {
        ++loadCount;
        return stored;
    }

    bool saveJobs(const std::vector<domain::Job>& jobs, domain::TimePoint savedAt) override {
        ++saveCount;
        stored = app::StoredJobs{jobs, savedAt};
        return !failWrites;
    }

    bool clearJobs() override {
        ++clearCount;
        stored.reset();
        return !failWrites;
    }

    std::optional<domain::Retention> loadRetention() const override { return retention; }

    bool saveRetention(domain::Retention r) override {
        retention = r;
        return !failWrites;
    }

    std::optional<app::StoredJobs>   stored;
    std::optional<domain::Retention> retention;
    bool                             failWrites{false};
    mutable int                      loadCount{0};
    int                              saveCount{0};
    int                              clearCount{0};
};

class FakeDraftRepository : public app::IDraftRepository {
public:
    void saveDrafts(const std::vector<domain::ApprovalItem>& items,
                    std::function<void(const app::DraftSaveResult&)> done) override {
        saved.push_back(items);
        done(result ? *result : app::DraftSaveResult{true, static_cast<int>(items.size()), {}});
    }

    // Answers at once with statusResult (default: ok, nothing applied to)
    // unless holdStatus is set; then completeStatus() answers the oldest
    // open request.
    void fetchApplicationStatus(const std::vector<domain::Job>& jobs,
                                std::function<void(const app::ApplicationStatusResult&)> done) override {
        statusRequests.push_back(jobs);
        if (holdStatus) {
            pendingStatus.push_back(std::move(done));
            return;
        }
        done(statusResult ? *statusResult : app::ApplicationStatusResult{true, {}, {}});
    }

    void completeStatus(const app::ApplicationStatusResult& r) {
        if (pendingStatus.empty()) {
            return;
        }
        auto done = std::move(pendingStatus.front());
        pendingStatus.pop_front();
        done(r);
    }

    std::optional<app::DraftSaveResult>            result;
    std::vector<std::vector<domain::ApprovalItem>> saved;

    std::optional<app::ApplicationStatusResult>            statusResult;
    bool                                                   holdStatus{false};
    std::vector<std::vector<domain::Job>>                  statusRequests;
    std::deque<std::function<void(const app::ApplicationStatusResult&)>> pendingStatus;
};

class FakeJobCacheClient : public app::IJobCacheClient {
public:
    struct Call {
        app::JobCacheAction action;
        domain::JobId       jobId;
    };

    void send(app::JobCacheAction action,
              const domain::JobId& jobId,
              std::function<void(app::JobCacheOutcome)> done) override {
        calls.push_back({action, jobId});
        pending = std::move(done);
        if (autoOutcome) {
            complete(*autoOutcome);
        }
    }

    void complete(app::JobCacheOutcome outcome) {
        auto done = std::move(pending);
        pending   = nullptr;
        if (done) {
            done(outcome);
        }
    }

    std::optional<app::JobCacheOutcome>        autoOutcome;
    std::function<void(app::JobCacheOutcome)>  pending;
    std::vector<Call>                          calls;
};

class FakeTransport : public net::IHandshakeTransport {
public:
    FakeTransport(QString name, bool succeed, std::vector<QString>* order = nullptr)
        : name_(std::move(name))
        , succeed_(succeed)
        , order_(order) {
    }

    QString name() const override { return name_; }

    void deliver(net::HandshakeKind kind, const QByteArray& payload, Handler done) override {
        ++calls;
        lastKind    = kind;
        lastPayload = payload;
        if (order_) {
            order_->push_back(name_);
        }
        done(succeed_, succeed_ ? QString() : QStringLiteral("connection refused"));
    }

    int               calls{0};
    net::HandshakeKind lastKind{net::HandshakeKind::Selection};
    QByteArray        lastPayload;

private:
    QString               name_;
    bool                  succeed_;
    std::vector<QString>* order_;
};

} // namespace jh::client::test
