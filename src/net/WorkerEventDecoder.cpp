#include "net/WorkerEventDecoder.hpp"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>

#include "net/JobJsonCodec.hpp"

namespace jh::client::net {

using namespace jh::client::domain;

namespace {

PlainTextLine plainText(const QByteArray& line) {
    PlainTextLine text;
    text.text  = QString::fromUtf8(line).trimmed().toStdString();
    text.noisy = isNoisyDiagnostic(text.text);
    return text;
}

StageChangeEvent parseStageChange(const QJsonObject& obj) {
    StageChangeEvent e;
    e.stage   = obj.value(QStringLiteral("stage")).toString().toStdString();
    e.message = obj.value(QStringLiteral("message")).toString().toStdString();

    const auto progress = obj.value(QStringLiteral("progress"));
    e.progress = progress.isDouble() ? static_cast<int>(progress.toDouble()) : 0;
    if (e.progress < 0) {
        e.progress = 0;
    } else if (e.progress > 100) {
        e.progress = 100;
    }
    return e;
}

} // namespace

WorkerEventDecoder::MessageType WorkerEventDecoder::detectMessageType(const QJsonObject& obj) {
    const auto type = obj.value(QStringLiteral("type")).toString();

    if (type == QLatin1String("stage_change")) return MessageType::StageChange;
    if (type == QLatin1String("user_selection_required")) return MessageType::SelectionRequired;
    if (type == QLatin1String("user_approval_required")) return MessageType::ApprovalRequired;
    if (type == QLatin1String("final_results")) return MessageType::FinalResults;
    if (type == QLatin1String("heartbeat")) return MessageType::Heartbeat;
    return MessageType::Unknown;
}

WorkflowEvent WorkerEventDecoder::decode(const QByteArray& line) {
    const QByteArray trimmed = line.trimmed();
    if (!trimmed.startsWith('{')) {
        return plainText(line);
    }

    QJsonParseError err{};
    const auto      doc = QJsonDocument::fromJson(trimmed, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return plainText(line);
    }

    const auto obj = doc.object();
    switch (detectMessageType(obj)) {
        case MessageType::StageChange:
            return parseStageChange(obj);

        case MessageType::SelectionRequired:
            return SelectionRequiredEvent{JobJsonCodec::jobsFromJson(obj.value(QStringLiteral("ranked_jobs")))};

        case MessageType::ApprovalRequired:
            return ApprovalRequiredEvent{
                JobJsonCodec::applicationsFromJson(obj.value(QStringLiteral("applications")))};

        case MessageType::FinalResults:
            return FinalResultsEvent{JobJsonCodec::jobsFromJson(obj.value(QStringLiteral("jobs")))};

        case MessageType::Heartbeat:
            return HeartbeatEvent{};

        case MessageType::Unknown:
            break;
    }

    const auto type = obj.value(QStringLiteral("type")).toString();
    qDebug() << "Unknown message type from worker:" << type;
    return UnknownEvent{type.toStdString()};
}

} // namespace jh::client::net
