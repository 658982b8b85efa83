#pragma once

#include <QUrl>

#include "net/IHandshakeTransport.hpp"

namespace jh::client::net {

class HttpJsonClient;

// POST <base>/job-selection | <base>/application-approval
class HttpHandshakeTransport final : public IHandshakeTransport {
public:
    HttpHandshakeTransport(HttpJsonClient& http, QUrl baseUrl);

    QString name() const override { return QStringLiteral("http"); }
    void deliver(HandshakeKind kind, const QByteArray& payload, Handler done) override;

    QUrl urlFor(HandshakeKind kind) const;

private:
    HttpJsonClient& http_;
    QUrl            baseUrl_;
};

} // namespace jh::client::net
