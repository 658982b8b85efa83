#include "ui/JobsModel.hpp"
#include "ui/UiFormatters.hpp"

#include <QBrush>
#include <QFont>
#include <QString>

namespace jh::client::ui {

using jh::client::domain::Job;

JobsModel::JobsModel(QObject* parent)
    : QAbstractTableModel(parent) {
}

void JobsModel::rebuildVisible() {
    visible_.clear();
    visible_.reserve(all_.size());
    for (const auto& job : all_) {
        if (showHidden_ || !job.isHidden()) {
            visible_.push_back(job);
        }
    }
}

void JobsModel::setJobs(const std::vector<Job>& jobs) {
    beginResetModel();
    all_ = jobs;
    rebuildVisible();
    endResetModel();
}

void JobsModel::setShowHidden(bool show) {
    if (show == showHidden_) {
        return;
    }
    beginResetModel();
    showHidden_ = show;
    rebuildVisible();
    endResetModel();
}

void JobsModel::setApplicationStatus(const domain::ApplicationStatusMap& statuses) {
    statuses_ = statuses;
    if (!visible_.empty()) {
        emit dataChanged(index(0, ColApplied), index(rowCount() - 1, ColApplied));
    }
}

const domain::ApplicationStatus* JobsModel::statusFor(const Job& job) const {
    const auto it = statuses_.find(job.id);
    return it == statuses_.end() ? nullptr : &it->second;
}

int JobsModel::rowCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : static_cast<int>(visible_.size());
}

int JobsModel::columnCount(const QModelIndex& parent) const {
    return parent.isValid() ? 0 : ColumnCount;
}

QVariant JobsModel::displayData(const Job& job, Column col) const {
    switch (col) {
        case ColTitle:
            return QString::fromStdString(job.title);

        case ColCompany:
            return QString::fromStdString(job.company);

        case ColLocation:
            return QString::fromStdString(job.location);

        case ColPlatform:
            return QString::fromStdString(job.platform);

        case ColScore:
            return fmt::formatScore(job.combinedScore ? *job.combinedScore : job.relevanceScore);

        case ColAmpel:
            return fmt::formatAmpel(job.ampel);

        case ColApplied: {
            const auto* status = statusFor(job);
            return job.applied || (status && status->hasApplication) ? QStringLiteral("yes") : QString();
        }

        default:
            return {};
    }
}

QVariant JobsModel::alignmentData(Column col) const {
    switch (col) {
        case ColScore:
            return static_cast<int>(Qt::AlignRight | Qt::AlignVCenter);
        case ColApplied:
            return static_cast<int>(Qt::AlignCenter);
        default:
            return static_cast<int>(Qt::AlignLeft | Qt::AlignVCenter);
    }
}

QVariant JobsModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid()) {
        return {};
    }

    const int row = index.row();
    const int col = index.column();

    if (row < 0 || row >= static_cast<int>(visible_.size())) {
        return {};
    }

    const Job& job = visible_[row];

    switch (role) {
        case Qt::DisplayRole:
            return displayData(job, static_cast<Column>(col));

        case Qt::TextAlignmentRole:
            return alignmentData(static_cast<Column>(col));

        case Qt::ForegroundRole:
            if (col == ColAmpel && job.ampel) {
                return QBrush(fmt::ampelColor(job.ampel->color));
            }
            if (job.isHidden()) {
                return QBrush(Qt::gray);
            }
            return {};

        case Qt::FontRole:
            if (job.isNewSinceLastSearch.value_or(false)) {
                QFont f;
                f.setBold(true);
                return f;
            }
            return {};

        case Qt::ToolTipRole:
            if (col == ColApplied) {
                const auto* status = statusFor(job);
                if (status && status->hasApplication) {
                    return status->applicationDate
                               ? tr("Application drafted on %1").arg(fmt::formatDate(*status->applicationDate))
                               : tr("Application drafted");
                }
                return {};
            }
            if (!job.url.empty()) {
                return QString::fromStdString(job.url);
            }
            return {};

        default:
            return {};
    }
}

QVariant JobsModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case ColTitle:
                return QStringLiteral("Title");
            case ColCompany:
                return QStringLiteral("Company");
            case ColLocation:
                return QStringLiteral("Location");
            case ColPlatform:
                return QStringLiteral("Platform");
            case ColScore:
                return QStringLiteral("Score");
            case ColAmpel:
                return QStringLiteral("Ampel");
            case ColApplied:
                return QStringLiteral("Applied");
            default:
                break;
        }
    }
    return QAbstractTableModel::headerData(section, orientation, role);
}

std::optional<Job> JobsModel::jobAtRow(int row) const {
    if (row < 0 || row >= static_cast<int>(visible_.size())) {
        return std::nullopt;
    }
    return visible_[row];
}

} // namespace jh::client::ui
