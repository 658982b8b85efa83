#pragma once

#include <optional>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::app {

struct StoredJobs {
    std::vector<jh::client::domain::Job> jobs;
    jh::client::domain::TimePoint        savedAt;
};

// Port/interface for the persisted job collection and its retention setting.
// The three values are stored independently; implementations live in infra
// (e.g. SQLite key/value table via QtSql).
//
// Implementations report failures by returning nullopt/false and logging;
// they never throw.
class IJobStorage {
public:
    virtual ~IJobStorage() = default;

    // nullopt if nothing is stored or the stored data cannot be read.
    virtual std::optional<StoredJobs> loadJobs() const = 0;
    virtual bool saveJobs(const std::vector<jh::client::domain::Job>& jobs,
                          jh::client::domain::TimePoint savedAt) = 0;
    virtual bool clearJobs() = 0;

    virtual std::optional<jh::client::domain::Retention> loadRetention() const = 0;
    virtual bool saveRetention(jh::client::domain::Retention retention) = 0;
};

} // namespace jh::client::app
