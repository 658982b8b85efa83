#pragma once

#include <QString>

#include <functional>

#include "net/IHandshakeTransport.hpp"

namespace jh::client::net {

// Drops the payload as <dir>/<stem>_<ms>.json for the worker to poll.
class FileHandshakeTransport final : public IHandshakeTransport {
public:
    using NowMsFn = std::function<qint64()>;

    explicit FileHandshakeTransport(QString directory, NowMsFn nowMs = {});

    QString name() const override { return QStringLiteral("file"); }
    void deliver(HandshakeKind kind, const QByteArray& payload, Handler done) override;

    QString pathFor(HandshakeKind kind, qint64 ms) const;

private:
    QString directory_;
    NowMsFn nowMs_;
};

} // namespace jh::client::net
