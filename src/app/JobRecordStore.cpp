#include "app/JobRecordStore.hpp"

#include <QDebug>

#include <algorithm>
#include <chrono>

namespace jh::client::app {

using namespace jh::client::domain;

JobRecordStore::JobRecordStore(IJobStorage* storage, NowFn now)
    : storage_(storage)
    , now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {
    if (storage_) {
        retention_ = storage_->loadRetention().value_or(Retention{});
    }
}

bool JobRecordStore::isExpired(TimePoint savedAt) const {
    if (retention_.isUnlimited()) {
        return false;
    }
    const auto maxAge = std::chrono::hours(24) * retention_.days;
    return (now_() - savedAt) > maxAge;
}

const std::vector<Job>& JobRecordStore::load() {
    jobs_.clear();
    if (!storage_) {
        return jobs_;
    }

    auto stored = storage_->loadJobs();
    if (!stored.has_value()) {
        return jobs_;
    }

    if (isExpired(stored->savedAt)) {
        qDebug() << "Persisted jobs expired (retention"
                 << QString::fromStdString(to_string(retention_)) << "), discarding"
                 << stored->jobs.size() << "jobs";
        if (!storage_->clearJobs()) {
            qWarning() << "Failed to remove expired jobs from storage";
        }
        return jobs_;
    }

    jobs_ = std::move(stored->jobs);
    qDebug() << "Loaded" << jobs_.size() << "persisted jobs";
    return jobs_;
}

void JobRecordStore::save(const std::vector<Job>& jobs) {
    jobs_ = jobs;
    persist();
}

void JobRecordStore::persist() {
    if (!storage_) {
        return;
    }
    if (!storage_->saveJobs(jobs_, now_())) {
        qWarning() << "Failed to persist" << jobs_.size() << "jobs";
    }
}

void JobRecordStore::setRetention(Retention retention) {
    retention_ = retention;
    if (storage_ && !storage_->saveRetention(retention)) {
        qWarning() << "Failed to persist storage retention";
    }
}

Job* JobRecordStore::findJob(const JobId& id) {
    auto it = std::find_if(jobs_.begin(), jobs_.end(),
                           [&id](const Job& j) { return j.id == id; });
    return it == jobs_.end() ? nullptr : &(*it);
}

const Job* JobRecordStore::findJob(const JobId& id) const {
    auto it = std::find_if(jobs_.begin(), jobs_.end(),
                           [&id](const Job& j) { return j.id == id; });
    return it == jobs_.end() ? nullptr : &(*it);
}

MergeStats JobRecordStore::mergeIncoming(const std::vector<Job>& batch) {
    MergeStats stats;
    jobs_ = JobMerger::merge(jobs_, batch, &stats);
    qDebug() << "Merged jobs:" << stats.added << "new," << stats.updated << "updated,"
             << (stats.skippedByUrl + stats.skippedBySignature) << "duplicates ->"
             << jobs_.size() << "total";
    persist();
    return stats;
}

bool JobRecordStore::setHidden(const JobId& id, bool hidden) {
    auto* job = findJob(id);
    if (!job) {
        return false;
    }
    job->hidden = hidden;
    persist();
    return true;
}

std::optional<std::pair<std::size_t, Job>> JobRecordStore::remove(const JobId& id) {
    for (std::size_t i = 0; i < jobs_.size(); ++i) {
        if (jobs_[i].id != id) {
            continue;
        }
        Job removed = std::move(jobs_[i]);
        jobs_.erase(jobs_.begin() + static_cast<long long>(i));
        persist();
        return std::make_pair(i, std::move(removed));
    }
    return std::nullopt;
}

bool JobRecordStore::insertAt(std::size_t index, Job job) {
    if (JobMerger::collidesWithAny(jobs_, job)) {
        return false;
    }
    index = std::min(index, jobs_.size());
    jobs_.insert(jobs_.begin() + static_cast<long long>(index), std::move(job));
    persist();
    return true;
}

void JobRecordStore::clear() {
    jobs_.clear();
    if (storage_ && !storage_->clearJobs()) {
        qWarning() << "Failed to clear persisted jobs";
    }
}

std::size_t JobRecordStore::removeDuplicates() {
    const std::size_t before = jobs_.size();
    jobs_ = JobMerger::removeDuplicates(jobs_);
    const std::size_t removed = before - jobs_.size();
    if (removed > 0) {
        persist();
    }
    return removed;
}

} // namespace jh::client::app
