#pragma once

#include <QAbstractTableModel>
#include <optional>
#include <vector>

#include "domain/domain_model.hpp"

namespace jh::client::ui {

// Job table; hidden jobs are left out unless showHidden is set.
class JobsModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit JobsModel(QObject* parent = nullptr);

    void setJobs(const std::vector<jh::client::domain::Job>& jobs);
    void setShowHidden(bool show);
    // Jobs with a draft on the drafts service count as applied as well.
    void setApplicationStatus(const jh::client::domain::ApplicationStatusMap& statuses);
    bool showHidden() const noexcept { return showHidden_; }

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    int columnCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    std::optional<jh::client::domain::Job> jobAtRow(int row) const;

    // Total number of jobs, including hidden ones.
    std::size_t totalCount() const noexcept { return all_.size(); }

private:
    enum Column {
        ColTitle = 0,
        ColCompany,
        ColLocation,
        ColPlatform,
        ColScore,
        ColAmpel,
        ColApplied,
        ColumnCount
    };

    void rebuildVisible();

    QVariant displayData(const jh::client::domain::Job& job, Column col) const;
    QVariant alignmentData(Column col) const;
    const jh::client::domain::ApplicationStatus* statusFor(const jh::client::domain::Job& job) const;

    std::vector<jh::client::domain::Job> all_;
    std::vector<jh::client::domain::Job> visible_;
    jh::client::domain::ApplicationStatusMap statuses_;
    bool                                 showHidden_{false};
};

} // namespace jh::client::ui
