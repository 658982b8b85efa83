#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QString>
#include <QUrl>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "app/JobRecordStore.hpp"
#include "app/WorkflowController.hpp"
#include "infra/AppConfigRepository.hpp"
#include "infra/SqliteJobStorage.hpp"
#include "infra/WorkerProcess.hpp"
#include "net/FileHandshakeTransport.hpp"
#include "net/HandshakeChannel.hpp"
#include "net/HttpDraftRepository.hpp"
#include "net/HttpHandshakeTransport.hpp"
#include "net/HttpJobCacheClient.hpp"
#include "net/HttpJsonClient.hpp"
#include "net/WorkerEventDecoder.hpp"
#include "ui/MainWindow.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("Job Hunter"));

    const QString appDir = QCoreApplication::applicationDirPath();
    qDebug() << "Application dir:" << appDir;

    // Help Qt find plugins shipped next to the binary (e.g. sqldrivers/libqsqlite.so).
    QCoreApplication::addLibraryPath(appDir);
    QCoreApplication::addLibraryPath(appDir + "/plugins");
    QCoreApplication::addLibraryPath(appDir + "/sqldrivers");

    const QString configPath = appDir + "/jobhunter.json";
    qDebug() << "Config path:" << configPath;

    jh::client::infra::AppConfigRepository configRepo(configPath.toStdString(), appDir.toStdString());
    const auto config = configRepo.load();

    const QString dbPath = QString::fromStdString(config.databasePath);
    qDebug() << "Jobs DB path:" << dbPath;

    jh::client::infra::SqliteJobStorage storage(dbPath);
    jh::client::app::JobRecordStore store(storage.isOpen() ? &storage : nullptr);

    jh::client::infra::WorkerProcess worker;
    jh::client::net::HttpJsonClient http;

    jh::client::net::HttpHandshakeTransport httpTransport(
        http, QUrl(QString::fromStdString(config.handshakeBaseUrl)));
    jh::client::net::FileHandshakeTransport fileTransport(
        QString::fromStdString(config.handshakeFallbackDir));
    jh::client::net::HandshakeChannel handshake(worker, {&httpTransport, &fileTransport});

    jh::client::net::HttpDraftRepository drafts(http, QUrl(QString::fromStdString(config.draftsUrl)));
    jh::client::net::HttpJobCacheClient jobCache(
        http,
        QUrl(QString::fromStdString(config.jobCacheUrl)),
        QString::fromStdString(config.profileName));

    jh::client::app::WorkflowController controller(store, worker, handshake, &drafts, &jobCache, config.worker);

    jh::client::ui::MainWindow w(controller);
    w.show();

    jh::client::app::WorkflowCallbacks cb;
    cb.onStatusChanged = [&](const jh::client::domain::WorkflowStatus& status) {
        w.notifyStatusChanged(status);
    };
    cb.onJobsChanged = [&](const std::vector<jh::client::domain::Job>& jobs) {
        w.notifyJobsChanged(jobs);
    };
    cb.onApplicationStatusChanged = [&](const jh::client::domain::ApplicationStatusMap& statuses) {
        w.notifyApplicationStatusChanged(statuses);
    };
    cb.onLogAppended = [&](const std::string& line) { w.notifyLogAppended(line); };
    cb.onLogsCleared = [&]() { w.notifyLogsCleared(); };
    cb.onNotice = [&](jh::client::app::NoticeLevel level, const std::string& text) {
        w.notifyNotice(level, text);
    };
    cb.onConfigChanged = [&](const jh::client::domain::RunConfig& c) { w.notifyConfigChanged(c); };
    cb.onSelectionRequired = [&](const std::vector<jh::client::domain::Job>& ranked,
                                 const std::optional<std::string>& error) {
        w.showSelection(ranked, error);
    };
    cb.onApprovalRequired = [&](const std::vector<jh::client::domain::GeneratedApplication>& apps,
                                const std::optional<std::string>& error) {
        w.showApproval(apps, error);
    };
    cb.onConfirmationChanged = [&](const std::optional<jh::client::domain::ConfirmationRequest>& request) {
        w.notifyConfirmationChanged(request);
    };
    controller.setCallbacks(std::move(cb));

    jh::client::app::WorkerProcessCallbacks processCb;
    processCb.onStdoutLine = [&](const std::string& line) {
        const QString text = QString::fromStdString(line);
        controller.handleWorkerEvent(jh::client::net::WorkerEventDecoder::decode(text), line);
    };
    processCb.onStderrLine = [&](const std::string& line) { controller.handleStderrLine(line); };
    processCb.onExited = [&](int exitCode, bool crashed) {
        controller.handleProcessExit(exitCode, crashed);
    };
    worker.setCallbacks(std::move(processCb));

    controller.loadPersistedJobs();

    const int rc = app.exec();

    // Leave no orphaned worker behind.
    if (worker.state() == jh::client::app::ProcessState::Running ||
        worker.state() == jh::client::app::ProcessState::Terminating) {
        worker.forceTerminate(std::chrono::milliseconds(0));
    }
    return rc;
}
