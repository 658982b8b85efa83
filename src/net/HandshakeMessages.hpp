#pragma once

#include <QByteArray>
#include <QJsonObject>

#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::net {

enum class HandshakeKind {
    Selection,
    Approval
};

// JSON bodies of the messages the client sends to the worker.
class HandshakeMessages final {
public:
    HandshakeMessages() = delete;

    // {"type":"job_selection","selected_job_ids":[int,...]}
    // Ids that are not integers are dropped with a warning.
    static QJsonObject selection(const std::vector<domain::JobId>& jobIds);

    // {"type":"application_approval","approved_applications":[...]}
    static QJsonObject approval(const std::vector<domain::ApprovalItem>& items);

    // {"type":"cancel"} followed by '\n', written to the worker's stdin.
    static QByteArray cancelLine();

    static QByteArray toBytes(const QJsonObject& obj);

    // Path segment / file name stem for a message kind.
    static QString endpoint(HandshakeKind kind);
    static QString fileStem(HandshakeKind kind);
};

} // namespace jh::client::net
