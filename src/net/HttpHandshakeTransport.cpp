#include "net/HttpHandshakeTransport.hpp"

#include "net/HttpJsonClient.hpp"

namespace jh::client::net {

HttpHandshakeTransport::HttpHandshakeTransport(HttpJsonClient& http, QUrl baseUrl)
    : http_(http)
    , baseUrl_(std::move(baseUrl)) {
}

QUrl HttpHandshakeTransport::urlFor(HandshakeKind kind) const {
    QString base = baseUrl_.toString();
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    return QUrl(base + QLatin1Char('/') + HandshakeMessages::endpoint(kind));
}

void HttpHandshakeTransport::deliver(HandshakeKind kind, const QByteArray& payload, Handler done) {
    http_.post(urlFor(kind), payload, [done = std::move(done)](const HttpReply& reply) {
        done(reply.ok, reply.errorMessage);
    });
}

} // namespace jh::client::net
