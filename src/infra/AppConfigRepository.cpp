#include "infra/AppConfigRepository.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace jh::client::infra {

using jh::client::domain::AppConfig;

namespace {

void readString(const QJsonObject& o, const char* key, std::string& out) {
    const auto v = o.value(QLatin1String(key));
    if (v.isUndefined()) {
        return;
    }
    if (!v.isString()) {
        qWarning() << "Config key" << key << "is not a string, keeping default";
        return;
    }
    out = v.toString().trimmed().toStdString();
}

} // namespace

AppConfigRepository::AppConfigRepository(std::string path, std::string baseDir)
    : path_(std::move(path))
    , baseDir_(std::move(baseDir)) {
}

std::string AppConfigRepository::resolve(const std::string& path) const {
    const auto qpath = QString::fromStdString(path);
    if (qpath.isEmpty() || QFileInfo(qpath).isAbsolute()) {
        return path;
    }
    return QDir(QString::fromStdString(baseDir_)).absoluteFilePath(qpath).toStdString();
}

AppConfig AppConfigRepository::defaults() const {
    AppConfig c;
    c.worker.workingDirectory = baseDir_;
    c.databasePath            = resolve(c.databasePath);
    return c;
}

AppConfig AppConfigRepository::load() const {
    AppConfig c = defaults();

    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Config not found, using defaults:" << QString::fromStdString(path_);
        return c;
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open config, using defaults:" << QString::fromStdString(path_);
        return c;
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid config, using defaults:" << parseErr.errorString();
        return c;
    }

    const auto root = doc.object();

    const auto worker = root.value(QStringLiteral("worker")).toObject();
    readString(worker, "program", c.worker.program);
    readString(worker, "script", c.worker.script);
    readString(worker, "working_dir", c.worker.workingDirectory);
    readString(worker, "kill_pattern", c.worker.killPattern);

    const auto handshake = root.value(QStringLiteral("handshake")).toObject();
    readString(handshake, "base_url", c.handshakeBaseUrl);
    readString(handshake, "fallback_dir", c.handshakeFallbackDir);

    readString(root, "drafts_url", c.draftsUrl);
    readString(root, "job_cache_url", c.jobCacheUrl);
    readString(root, "profile_name", c.profileName);

    std::string database;
    readString(root, "database", database);
    if (!database.empty()) {
        c.databasePath = resolve(database);
    }

    c.worker.workingDirectory = c.worker.workingDirectory.empty() ? baseDir_ : resolve(c.worker.workingDirectory);
    c.handshakeFallbackDir    = resolve(c.handshakeFallbackDir);

    if (c.worker.program.empty() || c.worker.script.empty()) {
        qWarning() << "Config has an empty worker program/script, using defaults for both";
        const AppConfig d;
        c.worker.program = d.worker.program;
        c.worker.script  = d.worker.script;
    }
    return c;
}

} // namespace jh::client::infra
