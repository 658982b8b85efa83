#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "app/IJobCacheClient.hpp"
#include "domain/domain_model.hpp"

namespace jh::client::app {

class JobRecordStore;

// One optimistic hide/unhide/delete.
//
// apply() mutates the store and the ranked batch right away and remembers
// what it changed. rollback() restores exactly that, and is only needed when
// the backend confirmed a failure (see shouldRollback).
class JobMutationCommand {
public:
    JobMutationCommand(JobCacheAction action, jh::client::domain::JobId jobId);

    JobCacheAction action() const noexcept { return action_; }
    const jh::client::domain::JobId& jobId() const noexcept { return jobId_; }

    // Returns false if the job is neither in the store nor in the ranked batch.
    bool apply(JobRecordStore& store, std::vector<jh::client::domain::Job>& ranked);
    void rollback(JobRecordStore& store, std::vector<jh::client::domain::Job>& ranked);

    static bool shouldRollback(JobCacheOutcome outcome) noexcept {
        return outcome == JobCacheOutcome::Failed;
    }

private:
    using Removed = std::optional<std::pair<std::size_t, jh::client::domain::Job>>;

    bool applyVisibility(JobRecordStore& store,
                         std::vector<jh::client::domain::Job>& ranked,
                         bool hidden);
    bool applyDelete(JobRecordStore& store, std::vector<jh::client::domain::Job>& ranked);

    JobCacheAction             action_;
    jh::client::domain::JobId  jobId_;

    // Visibility before apply(); nullopt if the job was not present there.
    std::optional<std::optional<bool>> storeHiddenBefore_;
    std::optional<std::optional<bool>> rankedHiddenBefore_;

    Removed removedFromStore_;
    Removed removedFromRanked_;
};

} // namespace jh::client::app
