#include "net/FileHandshakeTransport.hpp"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QSaveFile>

namespace jh::client::net {

FileHandshakeTransport::FileHandshakeTransport(QString directory, NowMsFn nowMs)
    : directory_(directory.isEmpty() ? QDir::tempPath() : std::move(directory))
    , nowMs_(nowMs ? std::move(nowMs) : NowMsFn([] { return QDateTime::currentMSecsSinceEpoch(); })) {
}

QString FileHandshakeTransport::pathFor(HandshakeKind kind, qint64 ms) const {
    return QDir(directory_).filePath(
        QStringLiteral("%1_%2.json").arg(HandshakeMessages::fileStem(kind)).arg(ms));
}

void FileHandshakeTransport::deliver(HandshakeKind kind, const QByteArray& payload, Handler done) {
    const QString path = pathFor(kind, nowMs_());

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        done(false, QStringLiteral("Cannot write %1: %2").arg(path, file.errorString()));
        return;
    }
    if (file.write(payload) != payload.size()) {
        const QString err = file.errorString();
        file.cancelWriting();
        done(false, QStringLiteral("Cannot write %1: %2").arg(path, err));
        return;
    }
    if (!file.commit()) {
        done(false, QStringLiteral("Cannot commit %1: %2").arg(path, file.errorString()));
        return;
    }

    qDebug() << "Handshake payload written to" << path;
    done(true, QString());
}

} // namespace jh::client::net
