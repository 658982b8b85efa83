#include "infra/SqliteJobStorage.hpp"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QVariant>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include <chrono>

#include "net/JobJsonCodec.hpp"

namespace jh::client::infra {

using jh::client::app::StoredJobs;
using jh::client::domain::Job;
using jh::client::domain::Retention;
using jh::client::domain::TimePoint;
using jh::client::net::JobJsonCodec;

namespace {

const QString kJobsKey            = QStringLiteral("jobs");
const QString kJobsTimestampKey   = QStringLiteral("jobs_timestamp");
const QString kStorageSettingsKey = QStringLiteral("storage_settings");

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

} // namespace

SqliteJobStorage::SqliteJobStorage(const QString& dbPath, const QString& connectionName) {
    if (QSqlDatabase::contains(connectionName)) {
        db_ = QSqlDatabase::database(connectionName);
    } else {
        db_ = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
        db_.setDatabaseName(dbPath);
    }

    if (!db_.open()) {
        qWarning() << "Failed to open job DB:" << db_.lastError().text();
        return;
    }

    initSchema();
}

SqliteJobStorage::~SqliteJobStorage() {
    if (db_.isOpen()) {
        db_.close();
    }
}

void SqliteJobStorage::initSchema() const {
    QSqlQuery q(db_);
    if (!q.exec("CREATE TABLE IF NOT EXISTS kv ("
                "key TEXT PRIMARY KEY,"
                "value TEXT)")) {
        qWarning() << "Failed to create kv table:" << q.lastError().text();
    }
}

std::optional<QString> SqliteJobStorage::readValue(const QString& key) const {
    if (!db_.isOpen()) {
        return std::nullopt;
    }

    QSqlQuery q(db_);
    q.prepare("SELECT value FROM kv WHERE key = ?");
    q.addBindValue(key);
    if (!q.exec()) {
        qWarning() << "Failed to read" << key << ":" << q.lastError().text();
        return std::nullopt;
    }
    if (!q.next()) {
        return std::nullopt;
    }
    return q.value(0).toString();
}

bool SqliteJobStorage::writeValue(const QString& key, const QString& value) {
    if (!db_.isOpen()) {
        return false;
    }

    QSqlQuery q(db_);
    q.prepare("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?)");
    q.addBindValue(key);
    q.addBindValue(value);
    if (!q.exec()) {
        qWarning() << "Failed to write" << key << ":" << q.lastError().text();
        return false;
    }
    return true;
}

bool SqliteJobStorage::removeValue(const QString& key) {
    if (!db_.isOpen()) {
        return false;
    }

    QSqlQuery q(db_);
    q.prepare("DELETE FROM kv WHERE key = ?");
    q.addBindValue(key);
    if (!q.exec()) {
        qWarning() << "Failed to remove" << key << ":" << q.lastError().text();
        return false;
    }
    return true;
}

std::optional<StoredJobs> SqliteJobStorage::loadJobs() const {
    const auto json  = readValue(kJobsKey);
    const auto stamp = readValue(kJobsTimestampKey);
    if (!json || !stamp) {
        return std::nullopt;
    }

    bool okStamp = false;
    const qint64 ms = stamp->toLongLong(&okStamp);
    if (!okStamp) {
        qWarning() << "Invalid jobs timestamp in storage:" << *stamp;
        return std::nullopt;
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(json->toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "Invalid jobs JSON in storage:" << err.errorString();
        return std::nullopt;
    }

    StoredJobs stored;
    stored.jobs    = JobJsonCodec::jobsFromJson(doc.array());
    stored.savedAt = fromUnixMs(ms);
    return stored;
}

bool SqliteJobStorage::saveJobs(const std::vector<Job>& jobs, TimePoint savedAt) {
    if (!db_.isOpen()) {
        return false;
    }

    const QString json = QString::fromUtf8(
        QJsonDocument(JobJsonCodec::jobsToJson(jobs)).toJson(QJsonDocument::Compact));

    if (!db_.transaction()) {
        qWarning() << "Failed to begin transaction:" << db_.lastError().text();
    }
    const bool ok = writeValue(kJobsKey, json) &&
                    writeValue(kJobsTimestampKey, QString::number(toUnixMs(savedAt)));
    if (!ok) {
        if (!db_.rollback()) {
            qWarning() << "Rollback failed:" << db_.lastError().text();
        }
        return false;
    }
    if (!db_.commit()) {
        qWarning() << "Commit failed:" << db_.lastError().text();
        return false;
    }
    return true;
}

bool SqliteJobStorage::clearJobs() {
    if (!db_.isOpen()) {
        return false;
    }

    if (!db_.transaction()) {
        qWarning() << "Failed to begin transaction:" << db_.lastError().text();
    }
    const bool ok = removeValue(kJobsKey) && removeValue(kJobsTimestampKey);
    if (!ok) {
        if (!db_.rollback()) {
            qWarning() << "Rollback failed:" << db_.lastError().text();
        }
        return false;
    }
    if (!db_.commit()) {
        qWarning() << "Commit failed:" << db_.lastError().text();
        return false;
    }
    return true;
}

std::optional<Retention> SqliteJobStorage::loadRetention() const {
    const auto json = readValue(kStorageSettingsKey);
    if (!json) {
        return std::nullopt;
    }

    const auto doc = QJsonDocument::fromJson(json->toUtf8());
    const auto days = doc.object().value(QStringLiteral("maxAgeDays"));
    if (!doc.isObject() || !days.isDouble()) {
        qWarning() << "Invalid storage settings, using default retention:" << *json;
        return std::nullopt;
    }

    const int d = days.toInt();
    if (d < 0) {
        return Retention::unlimited();
    }
    if (d == 0) {
        qWarning() << "Retention of 0 days is not supported, using default";
        return std::nullopt;
    }
    return Retention::ofDays(d);
}

bool SqliteJobStorage::saveRetention(Retention retention) {
    QJsonObject o;
    o.insert(QStringLiteral("maxAgeDays"), retention.isUnlimited() ? Retention::kUnlimitedDays : retention.days);
    return writeValue(kStorageSettingsKey,
                      QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact)));
}

} // namespace jh::client::infra
