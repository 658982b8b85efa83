#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "app/IJobStorage.hpp"
#include "app/JobMerger.hpp"
#include "domain/domain_model.hpp"

namespace jh::client::app {

// Ordered in-memory job collection mirrored to IJobStorage.
//
// Every mutation is written through with a fresh timestamp. Expiry is
// evaluated only in load(): if the persisted batch is older than the
// retention window the whole batch is dropped, not single records.
class JobRecordStore {
public:
    using NowFn = std::function<jh::client::domain::TimePoint()>;

    explicit JobRecordStore(IJobStorage* storage = nullptr, NowFn now = {});

    const std::vector<jh::client::domain::Job>& load();
    void save(const std::vector<jh::client::domain::Job>& jobs);

    void setRetention(jh::client::domain::Retention retention);
    jh::client::domain::Retention retention() const noexcept {
        return retention_;
    }

    const std::vector<jh::client::domain::Job>& jobs() const noexcept {
        return jobs_;
    }
    const jh::client::domain::Job* findJob(const jh::client::domain::JobId& id) const;

    MergeStats mergeIncoming(const std::vector<jh::client::domain::Job>& batch);

    // Returns false if no job has this id.
    bool setHidden(const jh::client::domain::JobId& id, bool hidden);

    // Removes the job and returns it with its former position (for rollback).
    std::optional<std::pair<std::size_t, jh::client::domain::Job>> remove(
        const jh::client::domain::JobId& id);
    // Refuses (returns false) if a stored job already has the same id, url or
    // signature, e.g. because a merge re-added it after remove().
    bool insertAt(std::size_t index, jh::client::domain::Job job);

    // Drops the collection and the persisted keys.
    void clear();

    // Returns the number of removed duplicates.
    std::size_t removeDuplicates();

private:
    jh::client::domain::Job* findJob(const jh::client::domain::JobId& id);
    bool isExpired(jh::client::domain::TimePoint savedAt) const;
    void persist();

    IJobStorage*                          storage_;
    NowFn                                 now_;
    jh::client::domain::Retention         retention_;
    std::vector<jh::client::domain::Job>  jobs_;
};

} // namespace jh::client::app
