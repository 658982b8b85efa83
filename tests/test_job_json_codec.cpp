#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include "net/HandshakeMessages.hpp"
#include "net/JobJsonCodec.hpp"

using namespace jh::client::domain;
using jh::client::net::HandshakeKind;
using jh::client::net::HandshakeMessages;
using jh::client::net::JobJsonCodec;

namespace {

QJsonObject parseObject(const QByteArray& json) {
    return QJsonDocument::fromJson(json).object();
}

} // namespace

TEST(JobJsonCodec, NumericIdBecomesDecimalString) {
    EXPECT_EQ(JobJsonCodec::idFromJson(QJsonValue(42)), std::optional<JobId>("42"));
    EXPECT_EQ(JobJsonCodec::idFromJson(QJsonValue(42.0)), std::optional<JobId>("42"));
    EXPECT_EQ(JobJsonCodec::idFromJson(QJsonValue(QStringLiteral(" 17 "))), std::optional<JobId>("17"));
    EXPECT_FALSE(JobJsonCodec::idFromJson(QJsonValue(4.5)).has_value());
    EXPECT_FALSE(JobJsonCodec::idFromJson(QJsonValue(QString())).has_value());
    EXPECT_FALSE(JobJsonCodec::idFromJson(QJsonValue(true)).has_value());
}

TEST(JobJsonCodec, NumericIdOutsideExactIntegerRangeIsRejected) {
    EXPECT_EQ(JobJsonCodec::idFromJson(QJsonValue(9007199254740992.0)),
              std::optional<JobId>("9007199254740992"));
    EXPECT_EQ(JobJsonCodec::idFromJson(QJsonValue(-12.0)), std::optional<JobId>("-12"));
    EXPECT_FALSE(JobJsonCodec::idFromJson(QJsonValue(1e20)).has_value());
    EXPECT_FALSE(JobJsonCodec::idFromJson(QJsonValue(-1e300)).has_value());

    const auto line = parseObject(R"({"id": 1e20, "title": "Gärtner"})");
    EXPECT_FALSE(JobJsonCodec::jobFromJson(line).has_value());
}

TEST(JobJsonCodec, JobWithoutIdIsRejected) {
    EXPECT_FALSE(JobJsonCodec::jobFromJson(parseObject(R"({"title":"Gärtner"})")).has_value());
    EXPECT_FALSE(JobJsonCodec::jobFromJson(QJsonValue(3)).has_value());
}

TEST(JobJsonCodec, OptionalFieldsStayUnsetWhenAbsent) {
    const auto job = JobJsonCodec::jobFromJson(parseObject(R"({"id":"1","title":"Gärtner","company":"Grün"})"));
    ASSERT_TRUE(job.has_value());
    EXPECT_FALSE(job->hidden.has_value());
    EXPECT_FALSE(job->mlScore.has_value());
    EXPECT_FALSE(job->ampel.has_value());
    EXPECT_FALSE(job->applied);
}

TEST(JobJsonCodec, ReadsWorkerFieldNames) {
    const auto job = JobJsonCodec::jobFromJson(parseObject(
        R"({"id":"9","title":"Gärtner","company":"Grün","location":"Berlin","platform":"adzuna",)"
        R"("url":"https://a","relevance_score":6,"ml_score":0.8,"combined_score":7.1,"applied":true,)"
        R"("is_hidden":true,"date_posted":"2024-05-01","first_seen":"2024-05-02",)"
        R"("is_new_since_last_search":true,"description":"Pflege","salary_info":"3000 EUR",)"
        R"("ampel":{"color":"purple"}})"));
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->platform, "adzuna");
    EXPECT_DOUBLE_EQ(job->relevanceScore, 6.0);
    EXPECT_EQ(job->mlScore, std::optional<double>(0.8));
    EXPECT_TRUE(job->applied);
    EXPECT_TRUE(job->isHidden());
    EXPECT_EQ(job->isNewSinceLastSearch, std::optional<bool>(true));
    EXPECT_EQ(job->salaryInfo, std::optional<std::string>("3000 EUR"));
    // Unknown colour: no ampel rather than a wrong one.
    EXPECT_FALSE(job->ampel.has_value());
}

TEST(JobJsonCodec, JobToJsonOmitsUnsetOptionals) {
    Job job;
    job.id    = "5";
    job.title = "Florist";
    const auto o = JobJsonCodec::jobToJson(job);
    EXPECT_EQ(o.value(QStringLiteral("id")).toString(), QStringLiteral("5"));
    EXPECT_FALSE(o.contains(QStringLiteral("is_hidden")));
    EXPECT_FALSE(o.contains(QStringLiteral("ampel")));
    EXPECT_TRUE(o.contains(QStringLiteral("relevance_score")));
}

TEST(JobJsonCodec, ApprovalUsesNullForMissingText) {
    ApprovalItem item;
    item.jobId          = 12;
    item.companyAddress = std::string("Gartenweg 3, 10115 Berlin");

    const auto o = JobJsonCodec::approvalToJson(item);
    EXPECT_EQ(o.value(QStringLiteral("job_id")).toInt(), 12);
    EXPECT_TRUE(o.value(QStringLiteral("application_text")).isNull());
    EXPECT_EQ(o.value(QStringLiteral("company_address")).toString(), QStringLiteral("Gartenweg 3, 10115 Berlin"));
    EXPECT_FALSE(o.contains(QStringLiteral("force_pdf")));

    item.forcePdf = true;
    EXPECT_TRUE(JobJsonCodec::approvalToJson(item).value(QStringLiteral("force_pdf")).toBool());
}

TEST(JobJsonCodec, ApplicationAcceptsStringJobId) {
    const auto app = JobJsonCodec::applicationFromJson(parseObject(R"({"job_id":"31","company":"Grün"})"));
    ASSERT_TRUE(app.has_value());
    EXPECT_EQ(app->jobId, 31);
    EXPECT_FALSE(JobJsonCodec::applicationFromJson(parseObject(R"({"job_id":"abc"})")).has_value());
}

TEST(HandshakeMessages, SelectionSendsIntegerIds) {
    const auto o = HandshakeMessages::selection({"1", "22", "not-a-number"});
    EXPECT_EQ(o.value(QStringLiteral("type")).toString(), QStringLiteral("job_selection"));

    const auto ids = o.value(QStringLiteral("selected_job_ids")).toArray();
    ASSERT_EQ(ids.size(), 2);
    EXPECT_TRUE(ids.at(0).isDouble());
    EXPECT_EQ(ids.at(0).toInt(), 1);
    EXPECT_EQ(ids.at(1).toInt(), 22);
}

TEST(HandshakeMessages, Approval) {
    ApprovalItem item;
    item.jobId           = 3;
    item.applicationText = std::string("Sehr geehrte Damen und Herren");

    const auto o = HandshakeMessages::approval({item});
    EXPECT_EQ(o.value(QStringLiteral("type")).toString(), QStringLiteral("application_approval"));
    const auto approved = o.value(QStringLiteral("approved_applications")).toArray();
    ASSERT_EQ(approved.size(), 1);
    EXPECT_EQ(approved.at(0).toObject().value(QStringLiteral("job_id")).toInt(), 3);
}

TEST(HandshakeMessages, CancelLineIsOneJsonLine) {
    const QByteArray line = HandshakeMessages::cancelLine();
    ASSERT_TRUE(line.endsWith('\n'));
    EXPECT_EQ(line.count('\n'), 1);
    EXPECT_EQ(parseObject(line.trimmed()).value(QStringLiteral("type")).toString(), QStringLiteral("cancel"));
}

TEST(HandshakeMessages, EndpointsAndFileStems) {
    EXPECT_EQ(HandshakeMessages::endpoint(HandshakeKind::Selection), QStringLiteral("job-selection"));
    EXPECT_EQ(HandshakeMessages::endpoint(HandshakeKind::Approval), QStringLiteral("application-approval"));
    EXPECT_EQ(HandshakeMessages::fileStem(HandshakeKind::Selection), QStringLiteral("job_selection"));
    EXPECT_EQ(HandshakeMessages::fileStem(HandshakeKind::Approval), QStringLiteral("application_approval"));
}
