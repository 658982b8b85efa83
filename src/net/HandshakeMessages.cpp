#include "net/HandshakeMessages.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QString>

#include "net/JobJsonCodec.hpp"

namespace jh::client::net {

using namespace jh::client::domain;

QJsonObject HandshakeMessages::selection(const std::vector<JobId>& jobIds) {
    QJsonArray ids;
    for (const auto& id : jobIds) {
        bool ok = false;
        const qint64 numeric = QString::fromStdString(id).trimmed().toLongLong(&ok);
        if (!ok) {
            qWarning() << "Dropping non-numeric job id from selection:" << QString::fromStdString(id);
            continue;
        }
        ids.append(numeric);
    }

    QJsonObject o;
    o.insert(QStringLiteral("type"), QStringLiteral("job_selection"));
    o.insert(QStringLiteral("selected_job_ids"), ids);
    return o;
}

QJsonObject HandshakeMessages::approval(const std::vector<ApprovalItem>& items) {
    QJsonArray approved;
    for (const auto& item : items) {
        approved.append(JobJsonCodec::approvalToJson(item));
    }

    QJsonObject o;
    o.insert(QStringLiteral("type"), QStringLiteral("application_approval"));
    o.insert(QStringLiteral("approved_applications"), approved);
    return o;
}

QByteArray HandshakeMessages::cancelLine() {
    QJsonObject o;
    o.insert(QStringLiteral("type"), QStringLiteral("cancel"));
    return toBytes(o) + QByteArrayLiteral("\n");
}

QByteArray HandshakeMessages::toBytes(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QString HandshakeMessages::endpoint(HandshakeKind kind) {
    switch (kind) {
        case HandshakeKind::Selection: return QStringLiteral("job-selection");
        case HandshakeKind::Approval:  return QStringLiteral("application-approval");
    }
    return QString();
}

QString HandshakeMessages::fileStem(HandshakeKind kind) {
    switch (kind) {
        case HandshakeKind::Selection: return QStringLiteral("job_selection");
        case HandshakeKind::Approval:  return QStringLiteral("application_approval");
    }
    return QString();
}

} // namespace jh::client::net
