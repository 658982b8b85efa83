#include "net/HandshakeChannel.hpp"

#include <QDebug>

#include "app/IWorkerProcess.hpp"

namespace jh::client::net {

using namespace jh::client::domain;
using jh::client::app::HandshakeCallback;
using jh::client::app::HandshakeError;
using jh::client::app::HandshakeResult;

HandshakeChannel::HandshakeChannel(const app::IWorkerProcess& process,
                                   std::vector<IHandshakeTransport*> transports)
    : process_(process)
    , transports_(std::move(transports)) {
}

void HandshakeChannel::sendSelection(const std::vector<JobId>& jobIds, HandshakeCallback done) {
    send(HandshakeKind::Selection,
         HandshakeMessages::toBytes(HandshakeMessages::selection(jobIds)),
         std::move(done));
}

void HandshakeChannel::sendApproval(const std::vector<ApprovalItem>& items, HandshakeCallback done) {
    send(HandshakeKind::Approval,
         HandshakeMessages::toBytes(HandshakeMessages::approval(items)),
         std::move(done));
}

void HandshakeChannel::send(HandshakeKind kind, const QByteArray& payload, HandshakeCallback done) {
    if (!process_.isActive()) {
        qWarning() << "Handshake refused: worker is" << QString::fromStdString(to_string(process_.state()));
        done(HandshakeResult{false, HandshakeError::NoActiveProcess, "No active worker process."});
        return;
    }

    auto attempt = std::make_shared<Attempt>();
    attempt->kind    = kind;
    attempt->payload = payload;
    attempt->done    = std::move(done);
    tryNext(attempt);
}

void HandshakeChannel::tryNext(const std::shared_ptr<Attempt>& attempt) {
    if (attempt->next >= transports_.size()) {
        const QString joined = attempt->errors.isEmpty()
                                   ? QStringLiteral("no transport configured")
                                   : attempt->errors.join(QStringLiteral("; "));
        qWarning() << "All handshake transports failed:" << joined;
        attempt->done(HandshakeResult{false, HandshakeError::TransportFailed, joined.toStdString()});
        return;
    }

    IHandshakeTransport* transport = transports_[attempt->next++];
    transport->deliver(attempt->kind, attempt->payload,
                       [this, attempt, transport](bool ok, const QString& error) {
        if (ok) {
            qDebug() << "Handshake" << HandshakeMessages::fileStem(attempt->kind)
                     << "delivered via" << transport->name();
            attempt->done(HandshakeResult{true, HandshakeError::None, {}});
            return;
        }
        qWarning() << "Handshake via" << transport->name() << "failed:" << error;
        attempt->errors << transport->name() + QStringLiteral(": ") + error;
        tryNext(attempt);
    });
}

} // namespace jh::client::net
