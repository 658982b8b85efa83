#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "infra/AppConfigRepository.hpp"

using jh::client::domain::AppConfig;
using jh::client::infra::AppConfigRepository;

namespace {

class AppConfigRepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        configPath = QDir(dir.path()).filePath(QStringLiteral("jobhunter.json"));
    }

    void writeConfig(const QByteArray& json) {
        QFile f(configPath);
        ASSERT_TRUE(f.open(QIODevice::WriteOnly | QIODevice::Truncate));
        ASSERT_EQ(f.write(json), json.size());
    }

    AppConfigRepository repo() const {
        return AppConfigRepository(configPath.toStdString(), dir.path().toStdString());
    }

    std::string inDir(const char* name) const {
        return QDir(dir.path()).absoluteFilePath(QString::fromUtf8(name)).toStdString();
    }

    QTemporaryDir dir;
    QString       configPath;
};

} // namespace

TEST_F(AppConfigRepositoryTest, MissingFileGivesDefaults) {
    const AppConfig c = repo().load();
    const AppConfig d;
    EXPECT_EQ(c.worker.program, d.worker.program);
    EXPECT_EQ(c.worker.script, d.worker.script);
    EXPECT_EQ(c.worker.workingDirectory, dir.path().toStdString());
    EXPECT_EQ(c.handshakeBaseUrl, d.handshakeBaseUrl);
    EXPECT_EQ(c.databasePath, inDir("jobhunter.sqlite"));
}

TEST_F(AppConfigRepositoryTest, InvalidJsonGivesDefaults) {
    writeConfig("{ not json");
    EXPECT_EQ(repo().load().worker.script, AppConfig{}.worker.script);
}

TEST_F(AppConfigRepositoryTest, ReadsNestedKeysAndResolvesRelativePaths) {
    writeConfig(R"({
        "worker": {"program": "/usr/bin/python3", "script": "agent.py",
                   "working_dir": "backend", "kill_pattern": "agent.py --interactive"},
        "handshake": {"base_url": "http://127.0.0.1:9000", "fallback_dir": "handoff"},
        "drafts_url": "http://127.0.0.1:9000/drafts",
        "job_cache_url": "http://127.0.0.1:5002/api/jobs",
        "profile_name": "gardening",
        "database": "data/jobs.sqlite"
    })");

    const AppConfig c = repo().load();
    EXPECT_EQ(c.worker.program, "/usr/bin/python3");
    EXPECT_EQ(c.worker.script, "agent.py");
    EXPECT_EQ(c.worker.workingDirectory, inDir("backend"));
    EXPECT_EQ(c.worker.killPattern, "agent.py --interactive");
    EXPECT_EQ(c.handshakeBaseUrl, "http://127.0.0.1:9000");
    EXPECT_EQ(c.handshakeFallbackDir, inDir("handoff"));
    EXPECT_EQ(c.draftsUrl, "http://127.0.0.1:9000/drafts");
    EXPECT_EQ(c.profileName, "gardening");
    EXPECT_EQ(c.databasePath, inDir("data/jobs.sqlite"));
}

TEST_F(AppConfigRepositoryTest, WrongTypesKeepDefaults) {
    writeConfig(R"({"worker": {"program": 3}, "profile_name": ["x"]})");
    const AppConfig c = repo().load();
    EXPECT_EQ(c.worker.program, AppConfig{}.worker.program);
    EXPECT_EQ(c.profileName, AppConfig{}.profileName);
}

TEST_F(AppConfigRepositoryTest, EmptyScriptFallsBackToDefaultWorker) {
    writeConfig(R"({"worker": {"program": "python", "script": ""}})");
    const AppConfig c = repo().load();
    EXPECT_EQ(c.worker.program, AppConfig{}.worker.program);
    EXPECT_EQ(c.worker.script, AppConfig{}.worker.script);
}
