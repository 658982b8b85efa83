#pragma once

#include <QByteArray>
#include <QString>

#include <functional>

#include "net/HandshakeMessages.hpp"

namespace jh::client::net {

// One way of getting a decision to the worker (HTTP, file drop, ...).
class IHandshakeTransport {
public:
    using Handler = std::function<void(bool ok, const QString& errorMessage)>;

    virtual ~IHandshakeTransport() = default;

    virtual QString name() const = 0;

    // `done` is called exactly once.
    virtual void deliver(HandshakeKind kind, const QByteArray& payload, Handler done) = 0;
};

} // namespace jh::client::net
