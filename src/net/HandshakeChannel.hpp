#pragma once

#include <QByteArray>
#include <QStringList>

#include <cstddef>
#include <memory>
#include <vector>

#include "app/IHandshakeChannel.hpp"
#include "net/IHandshakeTransport.hpp"

namespace jh::client::app {
class IWorkerProcess;
}

namespace jh::client::net {

// Delivers decisions to the live worker.
//
// Fails fast with NoActiveProcess unless the worker is running. Otherwise
// the transports are tried in the given order and the first success wins;
// the call fails only when all of them failed.
class HandshakeChannel final : public app::IHandshakeChannel {
public:
    HandshakeChannel(const app::IWorkerProcess& process,
                     std::vector<IHandshakeTransport*> transports);

    void sendSelection(const std::vector<domain::JobId>& jobIds,
                       app::HandshakeCallback done) override;
    void sendApproval(const std::vector<domain::ApprovalItem>& items,
                      app::HandshakeCallback done) override;

private:
    struct Attempt {
        HandshakeKind         kind;
        QByteArray            payload;
        std::size_t           next{0};
        QStringList           errors;
        app::HandshakeCallback done;
    };

    void send(HandshakeKind kind, const QByteArray& payload, app::HandshakeCallback done);
    void tryNext(const std::shared_ptr<Attempt>& attempt);

    const app::IWorkerProcess&        process_;
    std::vector<IHandshakeTransport*> transports_;
};

} // namespace jh::client::net
