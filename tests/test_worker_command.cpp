#include <gtest/gtest.h>

#include "app/WorkerCommand.hpp"

using namespace jh::client::domain;
using jh::client::app::buildWorkerCommand;
using jh::client::app::keywordString;
using jh::client::app::validateRunConfig;

namespace {

RunConfig validConfig() {
    RunConfig c;
    c.jobTitle = "Gärtner";
    c.location = "Berlin";
    return c;
}

} // namespace

TEST(WorkerCommand, SearchTermsWinOverJobTitle) {
    RunConfig c = validConfig();
    EXPECT_EQ(keywordString(c), QStringLiteral("Gärtner"));
    c.searchTerms = "  Landschaftsgärtner Baumpflege ";
    EXPECT_EQ(keywordString(c), QStringLiteral("Landschaftsgärtner Baumpflege"));
}

TEST(WorkerCommand, RejectsShortKeywords) {
    RunConfig c = validConfig();
    c.jobTitle = " G ";
    EXPECT_TRUE(validateRunConfig(c).has_value());
}

TEST(WorkerCommand, RejectsMissingLocationWithoutRemote) {
    RunConfig c = validConfig();
    c.location = "   ";
    EXPECT_TRUE(validateRunConfig(c).has_value());

    c.remote = true;
    EXPECT_FALSE(validateRunConfig(c).has_value());
}

TEST(WorkerCommand, AcceptsValidConfig) {
    EXPECT_FALSE(validateRunConfig(validConfig()).has_value());
}

TEST(WorkerCommand, BuildsArgumentList) {
    WorkerSettings settings;
    settings.program          = "python3";
    settings.script           = "job_hunter_ultimate.py";
    settings.workingDirectory = "/opt/jobhunter";

    RunConfig c = validConfig();
    c.maxJobs = 25;

    const auto cmd = buildWorkerCommand(settings, c);
    EXPECT_EQ(cmd.program, QStringLiteral("python3"));
    EXPECT_EQ(cmd.workingDirectory, QStringLiteral("/opt/jobhunter"));
    EXPECT_EQ(cmd.killPattern, QStringLiteral("job_hunter_ultimate.py"));

    const QStringList expected{
        QStringLiteral("job_hunter_ultimate.py"),
        QStringLiteral("--keywords"), QStringLiteral("Gärtner"),
        QStringLiteral("--max-jobs"), QStringLiteral("25"),
        QStringLiteral("--location"), QStringLiteral("Berlin"),
        QStringLiteral("--skip-stepstone"),
        QStringLiteral("--interactive"),
        QStringLiteral("--json-output"),
    };
    EXPECT_EQ(cmd.arguments, expected);
}

TEST(WorkerCommand, OptionalFlags) {
    RunConfig c;
    c.searchTerms         = "Florist";
    c.remote              = true;
    c.maxJobs             = 0;
    c.ageFilter.enabled   = true;
    c.ageFilter.maxDays   = 7;
    c.providers.stepstone = true;

    WorkerSettings settings;
    settings.killPattern = "job_hunter";

    const auto cmd  = buildWorkerCommand(settings, c);
    const auto args = cmd.arguments;

    EXPECT_FALSE(args.contains(QStringLiteral("--location")));
    EXPECT_TRUE(args.contains(QStringLiteral("--remote")));
    EXPECT_FALSE(args.contains(QStringLiteral("--skip-stepstone")));

    const int ageIdx = args.indexOf(QStringLiteral("--job-age-days"));
    ASSERT_GE(ageIdx, 0);
    EXPECT_EQ(args.at(ageIdx + 1), QStringLiteral("7"));

    const int maxIdx = args.indexOf(QStringLiteral("--max-jobs"));
    ASSERT_GE(maxIdx, 0);
    EXPECT_EQ(args.at(maxIdx + 1), QStringLiteral("15"));

    EXPECT_EQ(cmd.killPattern, QStringLiteral("job_hunter"));
}
