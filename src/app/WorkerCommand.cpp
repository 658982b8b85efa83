#include "app/WorkerCommand.hpp"

namespace jh::client::app {

using jh::client::domain::RunConfig;
using jh::client::domain::WorkerSettings;

namespace {

constexpr int kMinKeywordLength = 2;
constexpr int kDefaultMaxJobs   = 15;

} // namespace

QString keywordString(const RunConfig& config) {
    const QString terms = QString::fromStdString(config.searchTerms).trimmed();
    if (!terms.isEmpty()) {
        return terms;
    }
    return QString::fromStdString(config.jobTitle).trimmed();
}

std::optional<std::string> validateRunConfig(const RunConfig& config) {
    if (keywordString(config).size() < kMinKeywordLength) {
        return std::string("Please enter at least one search term (job title).");
    }

    const bool hasLocation = !QString::fromStdString(config.location).trimmed().isEmpty();
    if (!hasLocation && !config.remote) {
        return std::string("Please enter a location or enable remote search.");
    }
    return std::nullopt;
}

WorkerCommand buildWorkerCommand(const WorkerSettings& settings, const RunConfig& config) {
    WorkerCommand cmd;
    cmd.program          = QString::fromStdString(settings.program);
    cmd.workingDirectory = QString::fromStdString(settings.workingDirectory);
    cmd.killPattern      = settings.killPattern.empty()
                               ? QString::fromStdString(settings.script)
                               : QString::fromStdString(settings.killPattern);

    const int maxJobs = config.maxJobs > 0 ? config.maxJobs : kDefaultMaxJobs;

    cmd.arguments << QString::fromStdString(settings.script)
                  << QStringLiteral("--keywords") << keywordString(config)
                  << QStringLiteral("--max-jobs") << QString::number(maxJobs);

    const QString location = QString::fromStdString(config.location).trimmed();
    if (!location.isEmpty()) {
        cmd.arguments << QStringLiteral("--location") << location;
    }
    if (config.remote) {
        cmd.arguments << QStringLiteral("--remote");
    }
    if (config.ageFilter.enabled && config.ageFilter.maxDays > 0) {
        cmd.arguments << QStringLiteral("--job-age-days") << QString::number(config.ageFilter.maxDays);
    }
    if (!config.providers.stepstone) {
        cmd.arguments << QStringLiteral("--skip-stepstone");
    }

    cmd.arguments << QStringLiteral("--interactive") << QStringLiteral("--json-output");
    return cmd;
}

} // namespace jh::client::app
