#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include "domain/workflow_model.hpp"

namespace jh::client::net {

// Classifies one line of worker stdout.
//
// The worker writes one JSON object per line with a "type" tag. Anything
// that does not parse as a JSON object is plain diagnostic text. Never fails.
class WorkerEventDecoder final {
public:
    enum class MessageType {
        StageChange,
        SelectionRequired,
        ApprovalRequired,
        FinalResults,
        Heartbeat,
        Unknown
    };

    WorkerEventDecoder() = delete;

    static domain::WorkflowEvent decode(const QByteArray& line);
    static domain::WorkflowEvent decode(const QString& line) {
        return decode(line.toUtf8());
    }

    static MessageType detectMessageType(const QJsonObject& obj);
};

} // namespace jh::client::net
