#include "app/JobMutationCommand.hpp"

#include <QDebug>

#include <algorithm>

#include "app/JobMerger.hpp"
#include "app/JobRecordStore.hpp"

namespace jh::client::app {

using namespace jh::client::domain;

namespace {

std::vector<Job>::iterator findIn(std::vector<Job>& jobs, const JobId& id) {
    return std::find_if(jobs.begin(), jobs.end(),
                        [&id](const Job& j) { return j.id == id; });
}

} // namespace

JobMutationCommand::JobMutationCommand(JobCacheAction action, JobId jobId)
    : action_(action)
    , jobId_(std::move(jobId)) {
}

bool JobMutationCommand::apply(JobRecordStore& store, std::vector<Job>& ranked) {
    switch (action_) {
        case JobCacheAction::Hide:   return applyVisibility(store, ranked, true);
        case JobCacheAction::Unhide: return applyVisibility(store, ranked, false);
        case JobCacheAction::Delete: return applyDelete(store, ranked);
    }
    return false;
}

bool JobMutationCommand::applyVisibility(JobRecordStore& store,
                                         std::vector<Job>& ranked,
                                         bool hidden) {
    if (const Job* job = store.findJob(jobId_)) {
        storeHiddenBefore_ = job->hidden;
        store.setHidden(jobId_, hidden);
    }

    auto it = findIn(ranked, jobId_);
    if (it != ranked.end()) {
        rankedHiddenBefore_ = it->hidden;
        it->hidden = hidden;
    }

    return storeHiddenBefore_.has_value() || rankedHiddenBefore_.has_value();
}

bool JobMutationCommand::applyDelete(JobRecordStore& store, std::vector<Job>& ranked) {
    removedFromStore_ = store.remove(jobId_);

    auto it = findIn(ranked, jobId_);
    if (it != ranked.end()) {
        const auto index = static_cast<std::size_t>(it - ranked.begin());
        removedFromRanked_ = std::make_pair(index, std::move(*it));
        ranked.erase(it);
    }

    return removedFromStore_.has_value() || removedFromRanked_.has_value();
}

void JobMutationCommand::rollback(JobRecordStore& store, std::vector<Job>& ranked) {
    qDebug() << "Rolling back" << to_string(action_) << "of job" << QString::fromStdString(jobId_);

    if (action_ == JobCacheAction::Delete) {
        if (removedFromStore_) {
            if (!store.insertAt(removedFromStore_->first, std::move(removedFromStore_->second))) {
                qDebug() << "Job" << QString::fromStdString(jobId_)
                         << "was stored again meanwhile, not restoring the deleted copy";
            }
            removedFromStore_.reset();
        }
        // The ranked batch may have been replaced by a newer one in the meantime.
        if (removedFromRanked_ && !JobMerger::collidesWithAny(ranked, removedFromRanked_->second)) {
            const auto index = std::min(removedFromRanked_->first, ranked.size());
            ranked.insert(ranked.begin() + static_cast<long long>(index),
                          std::move(removedFromRanked_->second));
        }
        removedFromRanked_.reset();
        return;
    }

    if (storeHiddenBefore_) {
        store.setHidden(jobId_, storeHiddenBefore_->value_or(false));
    }
    if (rankedHiddenBefore_) {
        auto it = findIn(ranked, jobId_);
        if (it != ranked.end()) {
            it->hidden = *rankedHiddenBefore_;
        }
    }
}

} // namespace jh::client::app
