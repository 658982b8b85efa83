#include "ui/JobSelectionDialog.hpp"

#include "ui/UiFormatters.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QSignalBlocker>
#include <QVBoxLayout>

namespace jh::client::ui {

using jh::client::domain::Job;

namespace {

constexpr int kJobIdRole = Qt::UserRole + 1;

QString itemText(const Job& job) {
    QString text = QStringLiteral("%1 - %2")
                       .arg(QString::fromStdString(job.title), QString::fromStdString(job.company));
    if (!job.location.empty()) {
        text += QStringLiteral(" (%1)").arg(QString::fromStdString(job.location));
    }
    text += QStringLiteral("  [%1]").arg(fmt::formatScore(job.combinedScore ? *job.combinedScore
                                                                            : job.relevanceScore));
    if (job.ampel) {
        text += QStringLiteral("  %1").arg(fmt::formatAmpel(job.ampel));
    }
    return text;
}

} // namespace

JobSelectionDialog::JobSelectionDialog(QWidget* parent)
    : QDialog(parent) {
    setupUi();
}

void JobSelectionDialog::setupUi() {
    resize(700, 500);
    setWindowTitle(tr("Select jobs"));

    auto* mainLayout = new QVBoxLayout(this);

    headerLabel_ = new QLabel(this);
    headerLabel_->setWordWrap(true);
    mainLayout->addWidget(headerLabel_);

    errorLabel_ = new QLabel(this);
    errorLabel_->setWordWrap(true);
    errorLabel_->setStyleSheet(QStringLiteral("color: #c62828;"));
    errorLabel_->hide();
    mainLayout->addWidget(errorLabel_);

    jobsList_ = new QListWidget(this);
    jobsList_->setSelectionMode(QAbstractItemView::NoSelection);
    mainLayout->addWidget(jobsList_, 1);

    auto* buttonsLayout = new QHBoxLayout();
    selectAllBtn_  = new QPushButton(tr("Select all"), this);
    selectNoneBtn_ = new QPushButton(tr("Select none"), this);
    submitBtn_     = new QPushButton(tr("Generate applications"), this);
    cancelBtn_     = new QPushButton(tr("Cancel search"), this);
    submitBtn_->setDefault(true);

    buttonsLayout->addWidget(selectAllBtn_);
    buttonsLayout->addWidget(selectNoneBtn_);
    buttonsLayout->addStretch(1);
    buttonsLayout->addWidget(cancelBtn_);
    buttonsLayout->addWidget(submitBtn_);
    mainLayout->addLayout(buttonsLayout);

    connect(selectAllBtn_, &QPushButton::clicked, this, [this] { setAllChecked(true); });
    connect(selectNoneBtn_, &QPushButton::clicked, this, [this] { setAllChecked(false); });
    connect(submitBtn_, &QPushButton::clicked, this, &JobSelectionDialog::onSubmitClicked);
    connect(cancelBtn_, &QPushButton::clicked, this, &JobSelectionDialog::reject);
    connect(jobsList_, &QListWidget::itemChanged, this, &JobSelectionDialog::onItemChanged);
}

void JobSelectionDialog::present(const std::vector<Job>& rankedJobs,
                                 const std::optional<std::string>& error) {
    // Keep the user's ticks when the same batch is presented again after a failed submit.
    const QStringList previouslyChecked = error ? checkedJobIds() : QStringList{};

    {
        QSignalBlocker blocker(jobsList_);
        jobsList_->clear();
        for (const auto& job : rankedJobs) {
            auto* item = new QListWidgetItem(itemText(job), jobsList_);
            const QString id = QString::fromStdString(job.id);
            item->setData(kJobIdRole, id);
            item->setFlags(item->flags() | Qt::ItemIsUserCheckable);
            item->setCheckState(previouslyChecked.contains(id) ? Qt::Checked : Qt::Unchecked);
            if (!job.url.empty()) {
                item->setToolTip(QString::fromStdString(job.url));
            }
        }
    }

    headerLabel_->setText(tr("%n job(s) found. Tick the ones you want to apply for.", nullptr,
                             static_cast<int>(rankedJobs.size())));

    if (error) {
        errorLabel_->setText(tr("%1\nYou can retry.").arg(QString::fromStdString(*error)));
        errorLabel_->show();
    } else {
        errorLabel_->clear();
        errorLabel_->hide();
    }

    onItemChanged();
    show();
    raise();
    activateWindow();
}

void JobSelectionDialog::dismiss() {
    hide();
}

QStringList JobSelectionDialog::checkedJobIds() const {
    QStringList ids;
    for (int i = 0; i < jobsList_->count(); ++i) {
        const auto* item = jobsList_->item(i);
        if (item->checkState() == Qt::Checked) {
            ids << item->data(kJobIdRole).toString();
        }
    }
    return ids;
}

void JobSelectionDialog::setAllChecked(bool checked) {
    for (int i = 0; i < jobsList_->count(); ++i) {
        jobsList_->item(i)->setCheckState(checked ? Qt::Checked : Qt::Unchecked);
    }
}

void JobSelectionDialog::onItemChanged() {
    submitBtn_->setEnabled(!checkedJobIds().isEmpty());
}

void JobSelectionDialog::onSubmitClicked() {
    const QStringList ids = checkedJobIds();
    if (ids.isEmpty()) {
        QMessageBox::warning(this, tr("Select jobs"), tr("Select at least one job."));
        return;
    }
    dismiss();
    emit selectionSubmitted(ids);
}

void JobSelectionDialog::reject() {
    QDialog::reject();
    emit flowCancelled();
}

} // namespace jh::client::ui
