#pragma once

#include <QString>
#include <QtSql/QSqlDatabase>

#include <optional>

#include "app/IJobStorage.hpp"

namespace jh::client::infra {

// Job collection persisted in a SQLite key/value table:
//   kv(key TEXT PRIMARY KEY, value TEXT)
// Keys: "jobs" (JSON array), "jobs_timestamp" (ms since epoch),
// "storage_settings" ({"maxAgeDays": N}, -1 = unlimited).
class SqliteJobStorage : public jh::client::app::IJobStorage {
public:
    explicit SqliteJobStorage(const QString& dbPath,
                              const QString& connectionName = QStringLiteral("jobhunter"));
    ~SqliteJobStorage() override;

    bool isOpen() const { return db_.isOpen(); }

    std::optional<jh::client::app::StoredJobs> loadJobs() const override;
    bool saveJobs(const std::vector<jh::client::domain::Job>& jobs,
                  jh::client::domain::TimePoint savedAt) override;
    bool clearJobs() override;

    std::optional<jh::client::domain::Retention> loadRetention() const override;
    bool saveRetention(jh::client::domain::Retention retention) override;

private:
    void initSchema() const;

    std::optional<QString> readValue(const QString& key) const;
    bool writeValue(const QString& key, const QString& value);
    bool removeValue(const QString& key);

    QSqlDatabase db_;
};

} // namespace jh::client::infra
