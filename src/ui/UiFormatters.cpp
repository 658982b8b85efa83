#include "ui/UiFormatters.hpp"

#include <QDate>
#include <QDateTime>
#include <QTimeZone>
#include <chrono>

namespace jh::client::ui::fmt {

using namespace jh::client::domain;

QString formatLocalTime(TimePoint tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    const QDateTime dt =
        QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(ms), QTimeZone::utc());
    return dt.toLocalTime().toString(QStringLiteral("HH:mm:ss"));
}

QString formatDate(const std::string& iso) {
    const QString text = QString::fromStdString(iso);
    const QDateTime dt = QDateTime::fromString(text, Qt::ISODate);
    if (dt.isValid()) {
        return dt.toString(QStringLiteral("dd.MM.yyyy"));
    }
    const QDate d = QDate::fromString(text.left(10), Qt::ISODate);
    return d.isValid() ? d.toString(QStringLiteral("dd.MM.yyyy")) : text;
}

QString formatScore(double score) {
    return QString::number(score, 'f', 1);
}

QString formatScore(const std::optional<double>& score) {
    return score ? formatScore(*score) : QStringLiteral("-");
}

QString formatAmpel(const std::optional<Ampel>& ampel) {
    if (!ampel) {
        return {};
    }
    if (!ampel->label.empty()) {
        return QString::fromStdString(ampel->label);
    }
    return QString::fromStdString(to_string(ampel->color));
}

QColor ampelColor(AmpelColor color) {
    switch (color) {
        case AmpelColor::Green:  return QColor(0x2e, 0x7d, 0x32);
        case AmpelColor::Yellow: return QColor(0xf9, 0xa8, 0x25);
        case AmpelColor::Red:    return QColor(0xc6, 0x28, 0x28);
    }
    return {};
}

QString formatWorkflowState(const WorkflowStatus& status) {
    switch (status.state) {
        case WorkflowState::Idle:
            return status.error ? QStringLiteral("Idle (last start failed)") : QStringLiteral("Idle");
        case WorkflowState::Starting:
            return QStringLiteral("Starting...");
        case WorkflowState::Running: {
            const auto stage = status.stage ? QString::fromStdString(*status.stage) : QStringLiteral("Running");
            return QStringLiteral("%1 (%2%)").arg(stage).arg(status.progress);
        }
        case WorkflowState::Suspended:
            return status.suspendReason == SuspendReason::SelectionRequired
                       ? QStringLiteral("Waiting for your job selection")
                       : QStringLiteral("Waiting for your approval");
        case WorkflowState::Completed:
            return QStringLiteral("Completed");
        case WorkflowState::Cancelled:
            return QStringLiteral("Cancelled");
        case WorkflowState::Failed:
            return QStringLiteral("Failed: %1").arg(QString::fromStdString(to_string(status.failure)));
    }
    return {};
}

QString formatGeneration(const GenerationInfo& info) {
    if (info.total <= 0) {
        return {};
    }
    return QStringLiteral("%1 / %2 applications").arg(info.current).arg(info.total);
}

} // namespace jh::client::ui::fmt
