#pragma once

#include <QDialog>
#include <QStringList>

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

QT_BEGIN_NAMESPACE
class QLabel;
class QListWidget;
class QPushButton;
QT_END_NAMESPACE

namespace jh::client::ui {

// Lets the user pick which ranked jobs get an application.
// Closing the dialog without submitting cancels the search.
class JobSelectionDialog : public QDialog {
    Q_OBJECT

public:
    explicit JobSelectionDialog(QWidget* parent = nullptr);

    void present(const std::vector<jh::client::domain::Job>& rankedJobs,
                 const std::optional<std::string>& error);

    // Hides the dialog without emitting flowCancelled().
    void dismiss();

    QStringList checkedJobIds() const;

signals:
    void selectionSubmitted(const QStringList& jobIds);
    void flowCancelled();

protected:
    void reject() override;

private slots:
    void onSubmitClicked();
    void onItemChanged();

private:
    void setupUi();
    void setAllChecked(bool checked);

    QLabel*      headerLabel_{nullptr};
    QLabel*      errorLabel_{nullptr};
    QListWidget* jobsList_{nullptr};
    QPushButton* selectAllBtn_{nullptr};
    QPushButton* selectNoneBtn_{nullptr};
    QPushButton* submitBtn_{nullptr};
    QPushButton* cancelBtn_{nullptr};
};

} // namespace jh::client::ui
