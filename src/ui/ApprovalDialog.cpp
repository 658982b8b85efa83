#include "ui/ApprovalDialog.hpp"

#include <QCheckBox>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMessageBox>
#include <QPlainTextEdit>
#include <QPushButton>
#include <QTabWidget>
#include <QVBoxLayout>

namespace jh::client::ui {

using jh::client::domain::ApprovalItem;
using jh::client::domain::GeneratedApplication;

ApprovalDialog::ApprovalDialog(QWidget* parent)
    : QDialog(parent) {
    setupUi();
}

void ApprovalDialog::setupUi() {
    resize(900, 700);
    setWindowTitle(tr("Approve applications"));

    auto* mainLayout = new QVBoxLayout(this);

    headerLabel_ = new QLabel(this);
    headerLabel_->setWordWrap(true);
    mainLayout->addWidget(headerLabel_);

    errorLabel_ = new QLabel(this);
    errorLabel_->setWordWrap(true);
    errorLabel_->setStyleSheet(QStringLiteral("color: #c62828;"));
    errorLabel_->hide();
    mainLayout->addWidget(errorLabel_);

    tabs_ = new QTabWidget(this);
    mainLayout->addWidget(tabs_, 1);

    auto* buttonsLayout = new QHBoxLayout();
    submitBtn_ = new QPushButton(tr("Approve"), this);
    cancelBtn_ = new QPushButton(tr("Cancel search"), this);
    submitBtn_->setDefault(true);
    buttonsLayout->addStretch(1);
    buttonsLayout->addWidget(cancelBtn_);
    buttonsLayout->addWidget(submitBtn_);
    mainLayout->addLayout(buttonsLayout);

    connect(submitBtn_, &QPushButton::clicked, this, &ApprovalDialog::onSubmitClicked);
    connect(cancelBtn_, &QPushButton::clicked, this, &ApprovalDialog::reject);
}

QWidget* ApprovalDialog::buildPage(Page& page) {
    auto* w = new QWidget(tabs_);
    auto* layout = new QVBoxLayout(w);

    auto* form = new QFormLayout();

    page.includeCheck = new QCheckBox(tr("Send this application"), w);
    page.includeCheck->setChecked(true);

    page.addressEdit = new QLineEdit(w);
    page.addressEdit->setPlaceholderText(tr("Company address (optional)"));
    if (page.app.foundAddress) {
        page.addressEdit->setText(QString::fromStdString(*page.app.foundAddress));
    }

    page.forcePdfCheck = new QCheckBox(tr("Create PDF even without an address"), w);
    page.forcePdfCheck->setChecked(false);

    form->addRow(QString(), page.includeCheck);
    form->addRow(tr("Address:"), page.addressEdit);
    form->addRow(QString(), page.forcePdfCheck);
    if (!page.app.filename.empty()) {
        form->addRow(tr("File:"), new QLabel(QString::fromStdString(page.app.filename), w));
    }
    layout->addLayout(form);

    page.letterEdit = new QPlainTextEdit(w);
    page.letterEdit->setPlainText(QString::fromStdString(page.app.applicationText));
    layout->addWidget(page.letterEdit, 1);

    return w;
}

void ApprovalDialog::present(const std::vector<GeneratedApplication>& applications,
                             const std::optional<std::string>& error) {
    // A re-presented batch keeps the user's edits.
    const bool keepEdits = error.has_value() && pages_.size() == applications.size();

    if (!keepEdits) {
        tabs_->clear();
        pages_.clear();
        pages_.reserve(applications.size());

        for (const auto& app : applications) {
            pages_.push_back(Page{app});
        }
        for (auto& page : pages_) {
            const auto title = QStringLiteral("%1 - %2")
                                   .arg(QString::fromStdString(page.app.company),
                                        QString::fromStdString(page.app.jobTitle));
            tabs_->addTab(buildPage(page), title);
        }
    }

    headerLabel_->setText(tr("%n application(s) drafted. Review and approve.", nullptr,
                             static_cast<int>(applications.size())));

    if (error) {
        errorLabel_->setText(tr("%1\nYou can retry.").arg(QString::fromStdString(*error)));
        errorLabel_->show();
    } else {
        errorLabel_->clear();
        errorLabel_->hide();
    }

    show();
    raise();
    activateWindow();
}

void ApprovalDialog::dismiss() {
    hide();
}

std::vector<ApprovalItem> ApprovalDialog::approvedItems() const {
    std::vector<ApprovalItem> items;
    for (const auto& page : pages_) {
        if (!page.includeCheck->isChecked()) {
            continue;
        }

        ApprovalItem item;
        item.jobId           = page.app.jobId;
        item.applicationText = page.letterEdit->toPlainText().toStdString();
        item.company         = page.app.company;
        item.jobTitle        = page.app.jobTitle;

        const QString address = page.addressEdit->text().trimmed();
        if (!address.isEmpty()) {
            item.companyAddress = address.toStdString();
        }
        if (page.forcePdfCheck->isChecked()) {
            item.forcePdf = true;
        }
        items.push_back(std::move(item));
    }
    return items;
}

void ApprovalDialog::onSubmitClicked() {
    auto items = approvedItems();
    if (items.empty()) {
        QMessageBox::warning(this, tr("Approve applications"),
                             tr("Select at least one application, or cancel the search."));
        return;
    }
    dismiss();
    emit approvalSubmitted(items);
}

void ApprovalDialog::reject() {
    QDialog::reject();
    emit flowCancelled();
}

} // namespace jh::client::ui
