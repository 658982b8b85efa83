#pragma once

#include <QObject>
#include <QProcess>
#include <QString>

#include "app/IWorkerProcess.hpp"
#include "net/LineAssembler.hpp"

namespace jh::client::infra {

// The single supervised worker, backed by QProcess.
//
// stdout/stderr are split into lines; a trailing partial line is flushed
// when the process exits. All callbacks run on the thread owning this
// object.
class WorkerProcess final : public QObject, public jh::client::app::IWorkerProcess {
    Q_OBJECT

public:
    explicit WorkerProcess(QObject* parent = nullptr);
    ~WorkerProcess() override;

    void setCallbacks(jh::client::app::WorkerProcessCallbacks callbacks) override;

    jh::client::app::SpawnResult spawn(const jh::client::app::WorkerCommand& command) override;
    void cancel() override;
    void forceTerminate(std::chrono::milliseconds afterDelay) override;

    jh::client::app::ProcessState state() const override { return state_; }

private slots:
    void onReadyReadStdout();
    void onReadyReadStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onErrorOccurred(QProcess::ProcessError error);

private:
    void killNow(quint64 generation, bool wait);
    void flushPartialLines();
    void emitLine(const QByteArray& line, bool isStderr);

    QProcess*                                 proc_{nullptr};
    jh::client::app::ProcessState             state_{jh::client::app::ProcessState::NotStarted};
    jh::client::app::WorkerProcessCallbacks   callbacks_;
    jh::client::net::LineAssembler            stdoutLines_;
    jh::client::net::LineAssembler            stderrLines_;
    QString                                   killPattern_;
    quint64                                   generation_{0};
};

} // namespace jh::client::infra
