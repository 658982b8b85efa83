#include "ui/MainWindow.hpp"

#include <QAction>
#include <QCheckBox>
#include <QComboBox>
#include <QFile>
#include <QFileDialog>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QItemSelectionModel>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLabel>
#include <QLineEdit>
#include <QMenuBar>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QSplitter>
#include <QStatusBar>
#include <QTableView>
#include <QTimer>
#include <QVBoxLayout>

#include "domain/domain_model.hpp"
#include "net/JobJsonCodec.hpp"
#include "ui/ApprovalDialog.hpp"
#include "ui/JobExporter.hpp"
#include "ui/JobSelectionDialog.hpp"
#include "ui/UiFormatters.hpp"

namespace jh::client::ui {

using jh::client::app::NoticeLevel;
using jh::client::domain::ApplicationStatusMap;
using jh::client::domain::ConfirmationRequest;
using jh::client::domain::GeneratedApplication;
using jh::client::domain::Job;
using jh::client::domain::JobId;
using jh::client::domain::Retention;
using jh::client::domain::RunConfig;
using jh::client::domain::SuspendReason;
using jh::client::domain::WorkflowState;
using jh::client::domain::WorkflowStatus;

namespace {

constexpr int kLogMaxBlocks = 20000;

struct AgeOption {
    const char* label;
    int         days;
};

const AgeOption kAgeOptions[] = {
    {"Last 24 hours", 1},
    {"Last 3 days", 3},
    {"Last week", 7},
    {"Last 2 weeks", 14},
    {"Last month", 30},
    {"Last 3 months", 90},
};

} // namespace

MainWindow::MainWindow(jh::client::app::WorkflowController& controller, QWidget* parent)
    : QMainWindow(parent)
    , jobsModel_(this)
    , controller_(controller) {
    setupUi();
    setupConnections();

    applyRunConfigToForm(controller_.config());
    selectRetentionInCombo(controller_.retention());
    notifyJobsChanged(controller_.jobs());
    notifyApplicationStatusChanged(controller_.applicationStatus());
    notifyStatusChanged(controller_.status());
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUi() {
    resize(1280, 800);
    setWindowTitle(tr("Job Hunter"));

    setupMenu();

    centralWidget_ = new QWidget(this);
    setCentralWidget(centralWidget_);

    auto* mainLayout = new QVBoxLayout(centralWidget_);
    setupTopForm(mainLayout);
    setupButtonsRow(mainLayout);
    setupProgressRow(mainLayout);
    setupMainSplitter(mainLayout);

    selectionDialog_ = new JobSelectionDialog(this);
    approvalDialog_  = new ApprovalDialog(this);
}

void MainWindow::setupMenu() {
    auto* fileMenu = menuBar()->addMenu(tr("&File"));

    auto* exportJsonAction = fileMenu->addAction(tr("Export jobs to JSON..."));
    connect(exportJsonAction, &QAction::triggered, this, &MainWindow::exportJobsToJson);

    auto* exportLogsAction = fileMenu->addAction(tr("Export logs..."));
    connect(exportLogsAction, &QAction::triggered, this, &MainWindow::exportLogsToText);

    fileMenu->addSeparator();

    auto* reviewAction = fileMenu->addAction(tr("Review applications from file..."));
    connect(reviewAction, &QAction::triggered, this, &MainWindow::reviewApplicationsFromFile);

    auto* jobsMenu = menuBar()->addMenu(tr("&Jobs"));

    auto* dedupAction = jobsMenu->addAction(tr("Remove duplicates"));
    connect(dedupAction, &QAction::triggered, this, [this] { controller_.removeDuplicateJobs(); });

    auto* statusAction = jobsMenu->addAction(tr("Refresh application status"));
    connect(statusAction, &QAction::triggered, this, [this] { controller_.refreshApplicationStatus(); });

    auto* clearAction = jobsMenu->addAction(tr("Clear saved jobs..."));
    connect(clearAction, &QAction::triggered, this, [this] {
        const auto answer = QMessageBox::question(this, tr("Clear saved jobs"),
                                                  tr("Remove all saved jobs from this computer?"));
        if (answer == QMessageBox::Yes) {
            controller_.clearPersistedJobs();
        }
    });
}

void MainWindow::setupTopForm(QVBoxLayout* mainLayout) {
    auto* formLayout = new QFormLayout();

    jobTitleLineEdit_ = new QLineEdit(centralWidget_);
    jobTitleLineEdit_->setPlaceholderText(tr("e.g. Gärtner"));

    searchTermsLineEdit_ = new QLineEdit(centralWidget_);
    searchTermsLineEdit_->setPlaceholderText(tr("Optional; overrides the job title"));

    locationLineEdit_ = new QLineEdit(centralWidget_);
    locationLineEdit_->setPlaceholderText(tr("e.g. Berlin"));

    remoteCheck_ = new QCheckBox(tr("Remote"), centralWidget_);

    maxJobsSpin_ = new QSpinBox(centralWidget_);
    maxJobsSpin_->setRange(1, 200);

    auto* ageRow = new QHBoxLayout();
    ageFilterCheck_ = new QCheckBox(tr("Only jobs posted within"), centralWidget_);
    ageFilterCombo_ = new QComboBox(centralWidget_);
    for (const auto& opt : kAgeOptions) {
        ageFilterCombo_->addItem(tr(opt.label), QVariant(opt.days));
    }
    ageRow->addWidget(ageFilterCheck_);
    ageRow->addWidget(ageFilterCombo_);
    ageRow->addStretch(1);

    auto* providersRow = new QHBoxLayout();
    jsearchCheck_   = new QCheckBox(tr("JSearch"), centralWidget_);
    adzunaCheck_    = new QCheckBox(tr("Adzuna"), centralWidget_);
    stepstoneCheck_ = new QCheckBox(tr("StepStone"), centralWidget_);
    providersRow->addWidget(jsearchCheck_);
    providersRow->addWidget(adzunaCheck_);
    providersRow->addWidget(stepstoneCheck_);
    providersRow->addStretch(1);

    formLayout->addRow(tr("Job title:"), jobTitleLineEdit_);
    formLayout->addRow(tr("Search terms:"), searchTermsLineEdit_);
    formLayout->addRow(tr("Location:"), locationLineEdit_);
    formLayout->addRow(QString(), remoteCheck_);
    formLayout->addRow(tr("Max jobs:"), maxJobsSpin_);
    formLayout->addRow(tr("Age filter:"), ageRow);
    formLayout->addRow(tr("Providers:"), providersRow);

    mainLayout->addLayout(formLayout);
}

void MainWindow::setupButtonsRow(QVBoxLayout* mainLayout) {
    auto* buttonsLayout = new QHBoxLayout();
    startButton_       = new QPushButton(tr("Start search"), centralWidget_);
    stopButton_        = new QPushButton(tr("Stop"), centralWidget_);
    newSearchButton_   = new QPushButton(tr("New search"), centralWidget_);
    resetSearchButton_ = new QPushButton(tr("Reset search"), centralWidget_);
    resetAllButton_    = new QPushButton(tr("Reset all"), centralWidget_);

    buttonsLayout->addWidget(startButton_);
    buttonsLayout->addWidget(stopButton_);
    buttonsLayout->addWidget(newSearchButton_);
    buttonsLayout->addStretch();
    buttonsLayout->addWidget(resetSearchButton_);
    buttonsLayout->addWidget(resetAllButton_);
    mainLayout->addLayout(buttonsLayout);
}

void MainWindow::setupProgressRow(QVBoxLayout* mainLayout) {
    auto* row = new QHBoxLayout();

    stateLabel_ = new QLabel(centralWidget_);
    stateLabel_->setMinimumWidth(220);

    progressBar_ = new QProgressBar(centralWidget_);
    progressBar_->setRange(0, 100);

    generationLabel_ = new QLabel(centralWidget_);

    row->addWidget(stateLabel_);
    row->addWidget(progressBar_, 1);
    row->addWidget(generationLabel_);
    mainLayout->addLayout(row);

    messageLabel_ = new QLabel(centralWidget_);
    messageLabel_->setWordWrap(true);
    mainLayout->addWidget(messageLabel_);

    errorLabel_ = new QLabel(centralWidget_);
    errorLabel_->setWordWrap(true);
    errorLabel_->setStyleSheet(QStringLiteral("color: #c62828;"));
    errorLabel_->hide();
    mainLayout->addWidget(errorLabel_);
}

void MainWindow::setupMainSplitter(QVBoxLayout* mainLayout) {
    auto* splitter = new QSplitter(Qt::Horizontal, centralWidget_);

    auto* jobsPane   = new QWidget(splitter);
    auto* jobsLayout = new QVBoxLayout(jobsPane);
    jobsLayout->setContentsMargins(0, 0, 0, 0);

    auto* jobsToolbar = new QHBoxLayout();
    showHiddenCheck_ = new QCheckBox(tr("Show hidden"), jobsPane);
    hideButton_      = new QPushButton(tr("Hide"), jobsPane);
    unhideButton_    = new QPushButton(tr("Unhide"), jobsPane);
    deleteButton_    = new QPushButton(tr("Delete"), jobsPane);
    retentionCombo_  = new QComboBox(jobsPane);
    for (const auto& opt : jh::client::domain::retentionOptions()) {
        retentionCombo_->addItem(tr(opt.label), QVariant(opt.days));
    }
    jobsCountLabel_ = new QLabel(jobsPane);

    jobsToolbar->addWidget(showHiddenCheck_);
    jobsToolbar->addWidget(hideButton_);
    jobsToolbar->addWidget(unhideButton_);
    jobsToolbar->addWidget(deleteButton_);
    jobsToolbar->addStretch(1);
    jobsToolbar->addWidget(jobsCountLabel_);
    jobsToolbar->addWidget(new QLabel(tr("Keep jobs for:"), jobsPane));
    jobsToolbar->addWidget(retentionCombo_);
    jobsLayout->addLayout(jobsToolbar);

    jobsTableView_ = new QTableView(jobsPane);
    jobsTableView_->setModel(&jobsModel_);
    jobsTableView_->setSelectionBehavior(QAbstractItemView::SelectRows);
    jobsTableView_->setSelectionMode(QAbstractItemView::SingleSelection);
    jobsTableView_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    jobsTableView_->horizontalHeader()->setStretchLastSection(true);
    jobsLayout->addWidget(jobsTableView_, 1);

    logPlainTextEdit_ = new QPlainTextEdit(splitter);
    logPlainTextEdit_->setReadOnly(true);
    logPlainTextEdit_->setMaximumBlockCount(kLogMaxBlocks);

    splitter->addWidget(jobsPane);
    splitter->addWidget(logPlainTextEdit_);
    splitter->setStretchFactor(0, 3);
    splitter->setStretchFactor(1, 2);

    mainLayout->addWidget(splitter, 1);
}

void MainWindow::setupConnections() {
    connect(startButton_, &QPushButton::clicked, this, &MainWindow::onStartButtonClicked);
    connect(stopButton_, &QPushButton::clicked, this, &MainWindow::onStopButtonClicked);
    connect(newSearchButton_, &QPushButton::clicked, this, [this] { controller_.returnToIdle(); });
    connect(resetSearchButton_, &QPushButton::clicked, this, [this] { controller_.resetSearchConfig(); });
    connect(resetAllButton_, &QPushButton::clicked, this, [this] {
        const auto answer = QMessageBox::question(
            this, tr("Reset all"), tr("Stop the search and remove all jobs and logs?"));
        if (answer == QMessageBox::Yes) {
            controller_.resetAll();
        }
    });

    connect(hideButton_, &QPushButton::clicked, this, &MainWindow::onHideClicked);
    connect(unhideButton_, &QPushButton::clicked, this, &MainWindow::onUnhideClicked);
    connect(deleteButton_, &QPushButton::clicked, this, &MainWindow::onDeleteClicked);
    connect(showHiddenCheck_, &QCheckBox::toggled, this, [this](bool on) {
        jobsModel_.setShowHidden(on);
    });
    connect(retentionCombo_, &QComboBox::currentIndexChanged,
            this, &MainWindow::onRetentionChanged);

    connect(selectionDialog_, &JobSelectionDialog::selectionSubmitted, this, [this](const QStringList& ids) {
        std::vector<JobId> jobIds;
        jobIds.reserve(static_cast<size_t>(ids.size()));
        for (const auto& id : ids) {
            jobIds.push_back(id.toStdString());
        }
        controller_.submitSelection(jobIds);
    });
    connect(selectionDialog_, &JobSelectionDialog::flowCancelled, this, [this] { controller_.cancel(); });

    connect(approvalDialog_, &ApprovalDialog::approvalSubmitted, this,
            [this](const std::vector<jh::client::domain::ApprovalItem>& items) {
                controller_.submitApproval(items);
            });
    connect(approvalDialog_, &ApprovalDialog::flowCancelled, this, [this] { controller_.cancel(); });
}

// ---------------- Form ----------------

RunConfig MainWindow::collectRunConfig() const {
    RunConfig c = controller_.config();
    c.jobTitle    = jobTitleLineEdit_->text().trimmed().toStdString();
    c.searchTerms = searchTermsLineEdit_->text().trimmed().toStdString();
    c.location    = locationLineEdit_->text().trimmed().toStdString();
    c.remote      = remoteCheck_->isChecked();
    c.maxJobs     = maxJobsSpin_->value();

    c.ageFilter.enabled = ageFilterCheck_->isChecked();
    c.ageFilter.maxDays = ageFilterCombo_->currentData().toInt();
    c.jobAgeDays        = c.ageFilter.maxDays;

    c.providers.jsearch   = jsearchCheck_->isChecked();
    c.providers.adzuna    = adzunaCheck_->isChecked();
    c.providers.stepstone = stepstoneCheck_->isChecked();
    return c;
}

void MainWindow::applyRunConfigToForm(const RunConfig& config) {
    jobTitleLineEdit_->setText(QString::fromStdString(config.jobTitle));
    searchTermsLineEdit_->setText(QString::fromStdString(config.searchTerms));
    locationLineEdit_->setText(QString::fromStdString(config.location));
    remoteCheck_->setChecked(config.remote);
    maxJobsSpin_->setValue(config.maxJobs);

    ageFilterCheck_->setChecked(config.ageFilter.enabled);
    int ageIdx = ageFilterCombo_->findData(config.ageFilter.maxDays);
    if (ageIdx < 0) {
        ageIdx = ageFilterCombo_->findData(jh::client::domain::AgeFilter{}.maxDays);
    }
    ageFilterCombo_->setCurrentIndex(ageIdx);

    jsearchCheck_->setChecked(config.providers.jsearch);
    adzunaCheck_->setChecked(config.providers.adzuna);
    stepstoneCheck_->setChecked(config.providers.stepstone);
}

void MainWindow::selectRetentionInCombo(Retention retention) {
    QSignalBlocker blocker(retentionCombo_);
    const int days = retention.isUnlimited() ? Retention::kUnlimitedDays : retention.days;
    const int idx  = retentionCombo_->findData(days);
    if (idx >= 0) {
        retentionCombo_->setCurrentIndex(idx);
    }
}

// ---------------- Controller notifications ----------------

void MainWindow::notifyStatusChanged(const WorkflowStatus& status) {
    stateLabel_->setText(fmt::formatWorkflowState(status));
    progressBar_->setValue(status.progress);
    messageLabel_->setText(status.message ? QString::fromStdString(*status.message) : QString());
    generationLabel_->setText(fmt::formatGeneration(status.generation));

    if (status.error) {
        errorLabel_->setText(QString::fromStdString(*status.error));
        errorLabel_->show();
    } else {
        errorLabel_->clear();
        errorLabel_->hide();
    }

    // Dialogs only live while their decision is pending.
    if (!status.isSuspended(SuspendReason::SelectionRequired)) {
        selectionDialog_->dismiss();
    }
    if (!status.isSuspended(SuspendReason::ApprovalRequired)) {
        approvalDialog_->dismiss();
    }

    updateButtons(status);
}

void MainWindow::updateButtons(const WorkflowStatus& status) {
    const bool idle = status.state == WorkflowState::Idle;
    startButton_->setEnabled(idle);
    stopButton_->setEnabled(status.isBusy());
    newSearchButton_->setEnabled(status.isTerminal());
}

void MainWindow::notifyApplicationStatusChanged(const ApplicationStatusMap& statuses) {
    jobsModel_.setApplicationStatus(statuses);
}

void MainWindow::notifyJobsChanged(const std::vector<Job>& jobs) {
    jobsModel_.setJobs(jobs);

    std::size_t hidden = 0;
    for (const auto& j : jobs) {
        if (j.isHidden()) {
            ++hidden;
        }
    }
    jobsCountLabel_->setText(tr("%1 jobs (%2 hidden)").arg(jobs.size()).arg(hidden));
}

void MainWindow::notifyLogAppended(const std::string& line) {
    logPlainTextEdit_->appendPlainText(QString::fromStdString(line));
}

void MainWindow::notifyLogsCleared() {
    logPlainTextEdit_->clear();
}

void MainWindow::notifyNotice(NoticeLevel level, const std::string& text) {
    const QString message = QString::fromStdString(text);
    switch (level) {
        case NoticeLevel::Info:
        case NoticeLevel::Success:
            statusBar()->showMessage(message, 5000);
            break;
        case NoticeLevel::Error:
            statusBar()->showMessage(message, 10000);
            break;
        case NoticeLevel::Warning:
            statusBar()->showMessage(message, 8000);
            // Outside the controller's dispatch: the box runs its own event loop.
            QTimer::singleShot(0, this, [this, message] {
                QMessageBox::warning(this, tr("Job Hunter"), message);
            });
            break;
    }
}

void MainWindow::notifyConfigChanged(const RunConfig& config) {
    applyRunConfigToForm(config);
}

void MainWindow::notifyConfirmationChanged(const std::optional<ConfirmationRequest>& request) {
    if (!request) {
        return;
    }

    const QString label = QString::fromStdString(request->label);
    QTimer::singleShot(0, this, [this, label] {
        const auto answer = QMessageBox::question(
            this, tr("Delete job"),
            tr("Delete \"%1\" permanently? This cannot be undone.").arg(label));
        if (answer == QMessageBox::Yes) {
            controller_.confirmPendingAction();
        } else {
            controller_.cancelPendingAction();
        }
    });
}

void MainWindow::showSelection(const std::vector<Job>& rankedJobs, const std::optional<std::string>& error) {
    selectionDialog_->present(rankedJobs, error);
}

void MainWindow::showApproval(const std::vector<GeneratedApplication>& applications,
                              const std::optional<std::string>& error) {
    approvalDialog_->present(applications, error);
}

// ---------------- User actions ----------------

void MainWindow::onStartButtonClicked() {
    const RunConfig config = collectRunConfig();
    controller_.setConfig(config);
    controller_.start(config);
}

void MainWindow::onStopButtonClicked() {
    controller_.cancel();
}

std::optional<Job> MainWindow::selectedJob() const {
    auto* selectionModel = jobsTableView_->selectionModel();
    if (!selectionModel) {
        return std::nullopt;
    }
    const auto selected = selectionModel->selectedRows();
    if (selected.isEmpty()) {
        return std::nullopt;
    }
    return jobsModel_.jobAtRow(selected.first().row());
}

void MainWindow::onHideClicked() {
    if (const auto job = selectedJob()) {
        controller_.hideJob(job->id);
    }
}

void MainWindow::onUnhideClicked() {
    if (const auto job = selectedJob()) {
        controller_.unhideJob(job->id);
    }
}

void MainWindow::onDeleteClicked() {
    const auto job = selectedJob();
    if (!job) {
        return;
    }
    controller_.requestDeleteConfirmation(job->id, job->title + " - " + job->company);
}

void MainWindow::onRetentionChanged(int index) {
    const int days = retentionCombo_->itemData(index).toInt();
    controller_.setRetention(days < 0 ? Retention::unlimited() : Retention::ofDays(days));
}

// ---------------- Export / import ----------------

void MainWindow::exportJobsToJson() {
    const QString fileName = QFileDialog::getSaveFileName(
        this,
        tr("Export jobs as JSON"),
        QStringLiteral("jobs.json"),
        tr("JSON files (*.json)"));
    if (fileName.isEmpty()) {
        return;
    }

    const QJsonDocument doc = JobExporter::toJson(controller_.jobs());
    if (!JobExporter::writeFile(fileName, doc.toJson(QJsonDocument::Indented))) {
        QMessageBox::warning(this, tr("Error"), tr("Failed to write %1.").arg(fileName));
        return;
    }
    statusBar()->showMessage(tr("%1 jobs exported").arg(controller_.jobs().size()), 5000);
}

void MainWindow::exportLogsToText() {
    const QString fileName = QFileDialog::getSaveFileName(
        this,
        tr("Export logs"),
        QStringLiteral("job_hunter.log"),
        tr("Log files (*.log *.txt);;All files (*.*)"));
    if (fileName.isEmpty()) {
        return;
    }

    const QString text = JobExporter::logsToText(controller_.logs());
    if (!JobExporter::writeFile(fileName, text.toUtf8())) {
        QMessageBox::warning(this, tr("Error"), tr("Failed to write %1.").arg(fileName));
    }
}

void MainWindow::reviewApplicationsFromFile() {
    const QString fileName = QFileDialog::getOpenFileName(
        this,
        tr("Review applications"),
        QString(),
        tr("JSON files (*.json)"));
    if (fileName.isEmpty()) {
        return;
    }

    QFile file(fileName);
    if (!file.open(QIODevice::ReadOnly)) {
        QMessageBox::warning(this, tr("Error"), tr("Failed to open %1.").arg(fileName));
        return;
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError) {
        QMessageBox::warning(this, tr("Error"), tr("Invalid JSON: %1").arg(err.errorString()));
        return;
    }

    // Either a bare array or {"applications": [...]}.
    const QJsonValue list = doc.isArray() ? QJsonValue(doc.array())
                                          : doc.object().value(QStringLiteral("applications"));
    const auto apps = jh::client::net::JobJsonCodec::applicationsFromJson(list);
    controller_.presentApplications(apps);
}

} // namespace jh::client::ui
