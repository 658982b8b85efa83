#pragma once

#include <functional>

#include "domain/domain_model.hpp"

namespace jh::client::app {

enum class JobCacheAction {
    Hide   = 0,
    Unhide = 1,
    Delete = 2
};

enum class JobCacheOutcome {
    Ok          = 0,
    NotFound    = 1, // job only exists locally
    Unreachable = 2, // backend offline, nothing confirmed
    Failed      = 3  // backend answered with an error
};

// Port/interface for the backend job cache, synced best-effort after a local
// mutation. Implementations live in net (HTTP).
class IJobCacheClient {
public:
    virtual ~IJobCacheClient() = default;

    virtual void send(JobCacheAction action,
                      const jh::client::domain::JobId& jobId,
                      std::function<void(JobCacheOutcome)> done) = 0;
};

inline const char* to_string(JobCacheAction a) {
    switch (a) {
        case JobCacheAction::Hide:   return "hide";
        case JobCacheAction::Unhide: return "unhide";
        case JobCacheAction::Delete: return "delete";
    }
    return "";
}

} // namespace jh::client::app
