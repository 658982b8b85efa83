#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "fakes.hpp"
#include "net/FileHandshakeTransport.hpp"
#include "net/HandshakeChannel.hpp"

using namespace jh::client;
using jh::client::app::HandshakeError;
using jh::client::app::HandshakeResult;
using jh::client::net::FileHandshakeTransport;
using jh::client::net::HandshakeChannel;
using jh::client::net::HandshakeKind;
using jh::client::test::FakeTransport;
using jh::client::test::FakeWorkerProcess;

namespace {

class HandshakeChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(process.spawn(app::WorkerCommand{}).ok);
    }

    HandshakeResult sendSelection(HandshakeChannel& channel, const std::vector<domain::JobId>& ids) {
        HandshakeResult out;
        int calls = 0;
        channel.sendSelection(ids, [&](const HandshakeResult& r) {
            out = r;
            ++calls;
        });
        EXPECT_EQ(calls, 1);
        return out;
    }

    FakeWorkerProcess process;
};

} // namespace

TEST_F(HandshakeChannelTest, FailsFastWithoutActiveProcess) {
    FakeWorkerProcess idle;
    FakeTransport http(QStringLiteral("http"), true);
    HandshakeChannel channel(idle, {&http});

    const auto result = sendSelection(channel, {"1"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, HandshakeError::NoActiveProcess);
    EXPECT_EQ(http.calls, 0);
}

TEST_F(HandshakeChannelTest, TerminatingProcessIsNotActive) {
    process.cancel();
    FakeTransport http(QStringLiteral("http"), true);
    HandshakeChannel channel(process, {&http});

    EXPECT_EQ(sendSelection(channel, {"1"}).error, HandshakeError::NoActiveProcess);
    EXPECT_EQ(http.calls, 0);
}

TEST_F(HandshakeChannelTest, HttpSuccessSkipsFileFallback) {
    std::vector<QString> order;
    FakeTransport http(QStringLiteral("http"), true, &order);
    FakeTransport file(QStringLiteral("file"), true, &order);
    HandshakeChannel channel(process, {&http, &file});

    EXPECT_TRUE(sendSelection(channel, {"1", "2"}).ok);
    EXPECT_EQ(order, std::vector<QString>{QStringLiteral("http")});

    const auto body = QJsonDocument::fromJson(http.lastPayload).object();
    EXPECT_EQ(body.value(QStringLiteral("type")).toString(), QStringLiteral("job_selection"));
    EXPECT_EQ(http.lastKind, HandshakeKind::Selection);
}

TEST_F(HandshakeChannelTest, FallsBackToFileWhenHttpFails) {
    std::vector<QString> order;
    FakeTransport http(QStringLiteral("http"), false, &order);
    FakeTransport file(QStringLiteral("file"), true, &order);
    HandshakeChannel channel(process, {&http, &file});

    EXPECT_TRUE(sendSelection(channel, {"1"}).ok);
    EXPECT_EQ(order, (std::vector<QString>{QStringLiteral("http"), QStringLiteral("file")}));
    EXPECT_EQ(http.lastPayload, file.lastPayload);
}

TEST_F(HandshakeChannelTest, ReportsFailureOnlyWhenAllTransportsFail) {
    FakeTransport http(QStringLiteral("http"), false);
    FakeTransport file(QStringLiteral("file"), false);
    HandshakeChannel channel(process, {&http, &file});

    const auto result = sendSelection(channel, {"1"});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, HandshakeError::TransportFailed);
    EXPECT_NE(result.message.find("http"), std::string::npos);
    EXPECT_NE(result.message.find("file"), std::string::npos);
}

TEST_F(HandshakeChannelTest, NoTransportsIsAFailure) {
    HandshakeChannel channel(process, {});
    const auto result = sendSelection(channel, {"1"});
    EXPECT_EQ(result.error, HandshakeError::TransportFailed);
}

TEST_F(HandshakeChannelTest, ApprovalUsesApprovalKind) {
    FakeTransport http(QStringLiteral("http"), true);
    HandshakeChannel channel(process, {&http});

    domain::ApprovalItem item;
    item.jobId = 4;

    bool ok = false;
    channel.sendApproval({item}, [&](const HandshakeResult& r) { ok = r.ok; });
    EXPECT_TRUE(ok);
    EXPECT_EQ(http.lastKind, HandshakeKind::Approval);
    EXPECT_EQ(QJsonDocument::fromJson(http.lastPayload).object().value(QStringLiteral("type")).toString(),
              QStringLiteral("application_approval"));
}

TEST(FileHandshakeTransport, WritesPayloadToPredictablePath) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    FileHandshakeTransport transport(dir.path(), [] { return qint64(1700000000123); });
    const QString expectedPath = QDir(dir.path()).filePath(QStringLiteral("job_selection_1700000000123.json"));
    EXPECT_EQ(transport.pathFor(HandshakeKind::Selection, 1700000000123), expectedPath);

    const QByteArray payload(R"({"type":"job_selection","selected_job_ids":[1]})");
    bool    ok = false;
    QString error;
    transport.deliver(HandshakeKind::Selection, payload, [&](bool success, const QString& err) {
        ok    = success;
        error = err;
    });
    ASSERT_TRUE(ok) << error.toStdString();

    QFile written(expectedPath);
    ASSERT_TRUE(written.open(QIODevice::ReadOnly));
    EXPECT_EQ(written.readAll(), payload);
}

TEST(FileHandshakeTransport, ReportsUnwritableDirectory) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString missing = QDir(dir.path()).filePath(QStringLiteral("does/not/exist"));

    FileHandshakeTransport transport(missing);
    bool called = false;
    bool ok     = true;
    transport.deliver(HandshakeKind::Approval, QByteArray("{}"), [&](bool success, const QString&) {
        called = true;
        ok     = success;
    });
    EXPECT_TRUE(called);
    EXPECT_FALSE(ok);
}
