#pragma once

#include <functional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::app {

enum class HandshakeError {
    None            = 0,
    NoActiveProcess = 1,
    TransportFailed = 2
};

struct HandshakeResult {
    bool           ok{false};
    HandshakeError error{HandshakeError::None};
    std::string    message;
};

using HandshakeCallback = std::function<void(const HandshakeResult&)>;

// Port/interface for delivering interactive decisions back to the worker.
// The callback is invoked exactly once, possibly before the call returns.
class IHandshakeChannel {
public:
    virtual ~IHandshakeChannel() = default;

    virtual void sendSelection(const std::vector<jh::client::domain::JobId>& jobIds,
                               HandshakeCallback done) = 0;
    virtual void sendApproval(const std::vector<jh::client::domain::ApprovalItem>& items,
                              HandshakeCallback done) = 0;
};

} // namespace jh::client::app
