#pragma once

#include <QColor>
#include <QString>

#include <optional>
#include <string>

#include "domain/domain_model.hpp"
#include "domain/workflow_model.hpp"

namespace jh::client::ui::fmt {

// Format a domain timepoint as local time (HH:mm:ss).
QString formatLocalTime(jh::client::domain::TimePoint tp);

// ISO date or timestamp as dd.MM.yyyy; anything unparsable is returned as is.
QString formatDate(const std::string& iso);

// Small helpers for common UI string conversions.
QString formatScore(double score);
QString formatScore(const std::optional<double>& score);
QString formatAmpel(const std::optional<jh::client::domain::Ampel>& ampel);
QColor  ampelColor(jh::client::domain::AmpelColor color);

// "Running: Suche (40%)", "Waiting for your selection", ...
QString formatWorkflowState(const jh::client::domain::WorkflowStatus& status);

QString formatGeneration(const jh::client::domain::GenerationInfo& info);

} // namespace jh::client::ui::fmt
