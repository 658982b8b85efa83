#pragma once

#include <QDialog>

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

QT_BEGIN_NAMESPACE
class QCheckBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QPushButton;
class QTabWidget;
QT_END_NAMESPACE

namespace jh::client::ui {

// Review of the drafted letters: edit text and company address per
// application, then approve. Closing without submitting cancels the search.
class ApprovalDialog : public QDialog {
    Q_OBJECT

public:
    explicit ApprovalDialog(QWidget* parent = nullptr);

    void present(const std::vector<jh::client::domain::GeneratedApplication>& applications,
                 const std::optional<std::string>& error);

    // Hides the dialog without emitting flowCancelled().
    void dismiss();

    std::vector<jh::client::domain::ApprovalItem> approvedItems() const;

signals:
    void approvalSubmitted(const std::vector<jh::client::domain::ApprovalItem>& items);
    void flowCancelled();

protected:
    void reject() override;

private slots:
    void onSubmitClicked();

private:
    struct Page {
        jh::client::domain::GeneratedApplication app;
        QCheckBox*      includeCheck{nullptr};
        QCheckBox*      forcePdfCheck{nullptr};
        QLineEdit*      addressEdit{nullptr};
        QPlainTextEdit* letterEdit{nullptr};
    };

    void setupUi();
    QWidget* buildPage(Page& page);

    QLabel*      headerLabel_{nullptr};
    QLabel*      errorLabel_{nullptr};
    QTabWidget*  tabs_{nullptr};
    QPushButton* submitBtn_{nullptr};
    QPushButton* cancelBtn_{nullptr};

    std::vector<Page> pages_;
};

} // namespace jh::client::ui
