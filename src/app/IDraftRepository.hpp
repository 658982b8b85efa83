#pragma once

#include <functional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::app {

struct DraftSaveResult {
    bool        ok{false};
    int         saved{0};
    std::string message;
};

struct ApplicationStatusResult {
    bool                                     ok{false};
    jh::client::domain::ApplicationStatusMap statuses;
    std::string                              message;
};

// Port/interface to the drafts service: persists approved letters when no
// worker is attached (manual job path) and reports which jobs already have a
// draft. Implementations live in net (HTTP drafts API).
class IDraftRepository {
public:
    virtual ~IDraftRepository() = default;

    virtual void saveDrafts(const std::vector<jh::client::domain::ApprovalItem>& items,
                            std::function<void(const DraftSaveResult&)> done) = 0;

    virtual void fetchApplicationStatus(const std::vector<jh::client::domain::Job>& jobs,
                                        std::function<void(const ApplicationStatusResult&)> done) = 0;
};

} // namespace jh::client::app
