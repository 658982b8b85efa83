#pragma once

#include <QMainWindow>
#include <optional>
#include <string>
#include <vector>

#include "app/WorkflowController.hpp"
#include "ui/JobsModel.hpp"

class QCheckBox;
class QComboBox;
class QLabel;
class QLineEdit;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTableView;
class QVBoxLayout;

namespace jh::client::ui {

class ApprovalDialog;
class JobSelectionDialog;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(jh::client::app::WorkflowController& controller,
                        QWidget* parent = nullptr);
    ~MainWindow() override;

    void notifyStatusChanged(const jh::client::domain::WorkflowStatus& status);
    void notifyJobsChanged(const std::vector<jh::client::domain::Job>& jobs);
    void notifyApplicationStatusChanged(const jh::client::domain::ApplicationStatusMap& statuses);
    void notifyLogAppended(const std::string& line);
    void notifyLogsCleared();
    void notifyNotice(jh::client::app::NoticeLevel level, const std::string& text);
    void notifyConfigChanged(const jh::client::domain::RunConfig& config);
    void notifyConfirmationChanged(const std::optional<jh::client::domain::ConfirmationRequest>& request);

    void showSelection(const std::vector<jh::client::domain::Job>& rankedJobs,
                       const std::optional<std::string>& error);
    void showApproval(const std::vector<jh::client::domain::GeneratedApplication>& applications,
                      const std::optional<std::string>& error);

private slots:
    void onStartButtonClicked();
    void onStopButtonClicked();
    void onHideClicked();
    void onUnhideClicked();
    void onDeleteClicked();
    void onRetentionChanged(int index);
    void exportJobsToJson();
    void exportLogsToText();
    void reviewApplicationsFromFile();

private:
    void setupUi();
    void setupMenu();
    void setupTopForm(QVBoxLayout* mainLayout);
    void setupButtonsRow(QVBoxLayout* mainLayout);
    void setupProgressRow(QVBoxLayout* mainLayout);
    void setupMainSplitter(QVBoxLayout* mainLayout);
    void setupConnections();

    jh::client::domain::RunConfig collectRunConfig() const;
    void applyRunConfigToForm(const jh::client::domain::RunConfig& config);
    void updateButtons(const jh::client::domain::WorkflowStatus& status);
    void selectRetentionInCombo(jh::client::domain::Retention retention);

    std::optional<jh::client::domain::Job> selectedJob() const;

private:
    QWidget*        centralWidget_{nullptr};

    QLineEdit*      jobTitleLineEdit_{nullptr};
    QLineEdit*      searchTermsLineEdit_{nullptr};
    QLineEdit*      locationLineEdit_{nullptr};
    QCheckBox*      remoteCheck_{nullptr};
    QSpinBox*       maxJobsSpin_{nullptr};
    QCheckBox*      ageFilterCheck_{nullptr};
    QComboBox*      ageFilterCombo_{nullptr};
    QCheckBox*      jsearchCheck_{nullptr};
    QCheckBox*      adzunaCheck_{nullptr};
    QCheckBox*      stepstoneCheck_{nullptr};

    QPushButton*    startButton_{nullptr};
    QPushButton*    stopButton_{nullptr};
    QPushButton*    newSearchButton_{nullptr};
    QPushButton*    resetSearchButton_{nullptr};
    QPushButton*    resetAllButton_{nullptr};

    QProgressBar*   progressBar_{nullptr};
    QLabel*         stateLabel_{nullptr};
    QLabel*         messageLabel_{nullptr};
    QLabel*         generationLabel_{nullptr};
    QLabel*         errorLabel_{nullptr};

    QTableView*     jobsTableView_{nullptr};
    QCheckBox*      showHiddenCheck_{nullptr};
    QPushButton*    hideButton_{nullptr};
    QPushButton*    unhideButton_{nullptr};
    QPushButton*    deleteButton_{nullptr};
    QComboBox*      retentionCombo_{nullptr};
    QLabel*         jobsCountLabel_{nullptr};
    QPlainTextEdit* logPlainTextEdit_{nullptr};

    JobSelectionDialog* selectionDialog_{nullptr};
    ApprovalDialog*     approvalDialog_{nullptr};

    JobsModel       jobsModel_;

    jh::client::app::WorkflowController& controller_;
};

} // namespace jh::client::ui
