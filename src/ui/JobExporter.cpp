#include "ui/JobExporter.hpp"

#include <QDebug>
#include <QSaveFile>

#include "net/JobJsonCodec.hpp"

namespace jh::client::ui {

using jh::client::domain::Job;

QJsonDocument JobExporter::toJson(const std::vector<Job>& jobs) {
    return QJsonDocument(jh::client::net::JobJsonCodec::jobsToJson(jobs));
}

QString JobExporter::logsToText(const std::vector<std::string>& logs) {
    QString out;
    for (const auto& line : logs) {
        out += QString::fromStdString(line);
        out += QLatin1Char('\n');
    }
    return out;
}

bool JobExporter::writeFile(const QString& path, const QByteArray& data) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "Failed to open export file" << path << ":" << file.errorString();
        return false;
    }
    if (file.write(data) != data.size()) {
        qWarning() << "Failed to write export file" << path << ":" << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qWarning() << "Failed to commit export file" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

} // namespace jh::client::ui
