#pragma once

#include <QString>
#include <QStringList>

#include <optional>
#include <string>

#include "domain/app_config.hpp"
#include "domain/domain_model.hpp"

namespace jh::client::app {

struct WorkerCommand {
    QString     program;
    QStringList arguments;
    QString     workingDirectory;
    QString     killPattern;
};

// Search terms, falling back to the job title, trimmed.
QString keywordString(const jh::client::domain::RunConfig& config);

// User-facing reason why a run cannot start, or nullopt if it can.
std::optional<std::string> validateRunConfig(const jh::client::domain::RunConfig& config);

// <program> <script> --keywords K --max-jobs N [--location L] [--remote]
//     [--job-age-days D] [--skip-stepstone] --interactive --json-output
WorkerCommand buildWorkerCommand(const jh::client::domain::WorkerSettings& settings,
                                 const jh::client::domain::RunConfig& config);

} // namespace jh::client::app
