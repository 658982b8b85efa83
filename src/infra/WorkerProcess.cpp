#include "infra/WorkerProcess.hpp"

#include <QDebug>
#include <QProcessEnvironment>
#include <QTimer>

#include "net/HandshakeMessages.hpp"

namespace jh::client::infra {

using jh::client::app::ProcessState;
using jh::client::app::SpawnError;
using jh::client::app::SpawnResult;
using jh::client::app::WorkerCommand;
using jh::client::app::WorkerProcessCallbacks;

namespace {

constexpr int kStartTimeoutMs = 5000;
constexpr int kKillWaitMs     = 1000;

} // namespace

WorkerProcess::WorkerProcess(QObject* parent)
    : QObject(parent) {
}

WorkerProcess::~WorkerProcess() {
    if (proc_ && proc_->state() != QProcess::NotRunning) {
        proc_->disconnect(this);
        proc_->kill();
        if (!proc_->waitForFinished(kKillWaitMs)) {
            qWarning() << "Worker did not exit on shutdown";
        }
    }
}

void WorkerProcess::setCallbacks(WorkerProcessCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

SpawnResult WorkerProcess::spawn(const WorkerCommand& command) {
    if (state_ == ProcessState::Running || state_ == ProcessState::Terminating) {
        return SpawnResult{false, SpawnError::AlreadyRunning, "A worker process is already running."};
    }

    if (proc_) {
        proc_->disconnect(this);
        proc_->deleteLater();
        proc_ = nullptr;
    }

    ++generation_;
    stdoutLines_.reset();
    stderrLines_.reset();
    killPattern_ = command.killPattern;

    proc_ = new QProcess(this);
    proc_->setProgram(command.program);
    proc_->setArguments(command.arguments);
    if (!command.workingDirectory.isEmpty()) {
        proc_->setWorkingDirectory(command.workingDirectory);
    }
    proc_->setProcessChannelMode(QProcess::SeparateChannels);

    auto env = QProcessEnvironment::systemEnvironment();
    env.insert(QStringLiteral("PYTHONUNBUFFERED"), QStringLiteral("1"));
    env.insert(QStringLiteral("PYTHONIOENCODING"), QStringLiteral("utf-8"));
    proc_->setProcessEnvironment(env);

    connect(proc_, &QProcess::readyReadStandardOutput, this, &WorkerProcess::onReadyReadStdout);
    connect(proc_, &QProcess::readyReadStandardError, this, &WorkerProcess::onReadyReadStderr);
    connect(proc_, &QProcess::finished, this, &WorkerProcess::onFinished);
    connect(proc_, &QProcess::errorOccurred, this, &WorkerProcess::onErrorOccurred);

    proc_->start();
    if (!proc_->waitForStarted(kStartTimeoutMs)) {
        const QString err = proc_->errorString();
        qWarning() << "Failed to start worker" << command.program << ":" << err;
        state_ = ProcessState::Exited;
        return SpawnResult{false, SpawnError::FailedToStart, err.toStdString()};
    }

    state_ = ProcessState::Running;
    qDebug() << "Worker started, pid" << proc_->processId();
    return SpawnResult{true, SpawnError::None, {}};
}

void WorkerProcess::cancel() {
    if (state_ != ProcessState::Running || !proc_) {
        return;
    }

    if (proc_->isWritable()) {
        const QByteArray line = jh::client::net::HandshakeMessages::cancelLine();
        const qint64 written = proc_->write(line);
        if (written != line.size()) {
            qWarning() << "Cancel message not written to worker stdin:" << proc_->errorString();
        } else {
            qDebug() << "Cancel message written to worker stdin";
        }
    } else {
        qDebug() << "Worker stdin not writable, relying on forced kill";
    }

    state_ = ProcessState::Terminating;
    forceTerminate(jh::client::app::kForceKillGrace);
}

void WorkerProcess::forceTerminate(std::chrono::milliseconds afterDelay) {
    if (state_ == ProcessState::Running) {
        state_ = ProcessState::Terminating;
    }

    const quint64 generation = generation_;
    if (afterDelay.count() <= 0) {
        killNow(generation, true);
        return;
    }

    QTimer::singleShot(static_cast<int>(afterDelay.count()), this, [this, generation] {
        killNow(generation, false);
    });
}

void WorkerProcess::killNow(quint64 generation, bool wait) {
    if (generation != generation_) {
        return; // a newer worker was spawned meanwhile
    }

    if (proc_ && proc_->state() != QProcess::NotRunning) {
        qDebug() << "Killing worker pid" << proc_->processId();
        proc_->kill();
        if (wait && !proc_->waitForFinished(kKillWaitMs)) {
            qWarning() << "Worker did not exit after kill";
        }
    }

    // Child processes spawned by the worker are not in our process group.
    if (!killPattern_.isEmpty()) {
        if (!QProcess::startDetached(QStringLiteral("pkill"), {QStringLiteral("-f"), killPattern_})) {
            qWarning() << "pkill -f" << killPattern_ << "could not be started";
        }
    }
}

void WorkerProcess::onReadyReadStdout() {
    for (const auto& line : stdoutLines_.feed(proc_->readAllStandardOutput())) {
        emitLine(line, false);
    }
}

void WorkerProcess::onReadyReadStderr() {
    for (const auto& line : stderrLines_.feed(proc_->readAllStandardError())) {
        emitLine(line, true);
    }
}

void WorkerProcess::emitLine(const QByteArray& line, bool isStderr) {
    const std::string text = QString::fromUtf8(line).toStdString();
    if (isStderr) {
        if (callbacks_.onStderrLine) {
            callbacks_.onStderrLine(text);
        }
    } else if (callbacks_.onStdoutLine) {
        callbacks_.onStdoutLine(text);
    }
}

void WorkerProcess::flushPartialLines() {
    for (const auto& line : stdoutLines_.feed(proc_->readAllStandardOutput())) {
        emitLine(line, false);
    }
    if (auto rest = stdoutLines_.flush()) {
        emitLine(*rest, false);
    }

    for (const auto& line : stderrLines_.feed(proc_->readAllStandardError())) {
        emitLine(line, true);
    }
    if (auto rest = stderrLines_.flush()) {
        emitLine(*rest, true);
    }
}

void WorkerProcess::onFinished(int exitCode, QProcess::ExitStatus status) {
    flushPartialLines();

    state_ = ProcessState::Exited;
    const bool crashed = status == QProcess::CrashExit;
    qDebug() << "Worker finished, exit code" << exitCode << (crashed ? "(crashed)" : "");

    if (callbacks_.onExited) {
        callbacks_.onExited(exitCode, crashed);
    }
}

void WorkerProcess::onErrorOccurred(QProcess::ProcessError error) {
    qWarning() << "Worker process error" << error << ":" << (proc_ ? proc_->errorString() : QString());
}

} // namespace jh::client::infra
