#include <gtest/gtest.h>

#include <QJsonObject>

#include "net/WorkerEventDecoder.hpp"

using namespace jh::client::domain;
using jh::client::net::WorkerEventDecoder;

TEST(WorkerEventDecoder, StageChange) {
    const auto ev = WorkerEventDecoder::decode(
        QByteArray(R"({"type":"stage_change","stage":"searching","progress":20,"message":"Suche läuft"})"));

    const auto* e = std::get_if<StageChangeEvent>(&ev);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->stage, "searching");
    EXPECT_EQ(e->message, "Suche läuft");
    EXPECT_EQ(e->progress, 20);
}

TEST(WorkerEventDecoder, StageChangeProgressIsClamped) {
    const auto high = WorkerEventDecoder::decode(QByteArray(R"({"type":"stage_change","stage":"x","progress":250})"));
    const auto low  = WorkerEventDecoder::decode(QByteArray(R"({"type":"stage_change","stage":"x","progress":-5})"));
    ASSERT_TRUE(std::holds_alternative<StageChangeEvent>(high));
    ASSERT_TRUE(std::holds_alternative<StageChangeEvent>(low));
    EXPECT_EQ(std::get<StageChangeEvent>(high).progress, 100);
    EXPECT_EQ(std::get<StageChangeEvent>(low).progress, 0);
}

TEST(WorkerEventDecoder, SelectionRequiredCarriesRankedJobs) {
    const auto ev = WorkerEventDecoder::decode(QByteArray(
        R"({"type":"user_selection_required","ranked_jobs":[)"
        R"({"id":"1","title":"Gärtner","company":"Grün GmbH","url":"https://a","relevance_score":7.5,)"
        R"("ampel":{"color":"green","label":"Top","priority":1,"percentile":0.9,"score_tier":"A"}},)"
        R"({"id":2,"title":"Florist","company":"Blume KG"}]})"));

    const auto* e = std::get_if<SelectionRequiredEvent>(&ev);
    ASSERT_NE(e, nullptr);
    ASSERT_EQ(e->rankedJobs.size(), 2u);
    EXPECT_EQ(e->rankedJobs[0].id, "1");
    EXPECT_DOUBLE_EQ(e->rankedJobs[0].relevanceScore, 7.5);
    ASSERT_TRUE(e->rankedJobs[0].ampel.has_value());
    EXPECT_EQ(e->rankedJobs[0].ampel->color, AmpelColor::Green);
    EXPECT_EQ(e->rankedJobs[0].ampel->tier, "A");
    EXPECT_EQ(e->rankedJobs[1].id, "2");
}

TEST(WorkerEventDecoder, ApprovalRequiredCarriesApplications) {
    const auto ev = WorkerEventDecoder::decode(QByteArray(
        R"({"type":"user_approval_required","applications":[)"
        R"({"job_id":5,"job_title":"Gärtner","company":"Grün GmbH","application_text":"Sehr geehrte...",)"
        R"("filename":"a.docx","file_path":"/tmp/a.docx","found_address":"Weg 1","address_available":true}]})"));

    const auto* e = std::get_if<ApprovalRequiredEvent>(&ev);
    ASSERT_NE(e, nullptr);
    ASSERT_EQ(e->applications.size(), 1u);
    EXPECT_EQ(e->applications[0].jobId, 5);
    EXPECT_EQ(e->applications[0].foundAddress, std::optional<std::string>("Weg 1"));
    EXPECT_TRUE(e->applications[0].addressAvailable);
    EXPECT_FALSE(e->applications[0].pdfPath.has_value());
}

TEST(WorkerEventDecoder, FinalResults) {
    const auto ev = WorkerEventDecoder::decode(
        QByteArray(R"({"type":"final_results","jobs":[{"id":"1","title":"Gärtner","company":"Grün GmbH"}]})"));
    const auto* e = std::get_if<FinalResultsEvent>(&ev);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->jobs.size(), 1u);
}

TEST(WorkerEventDecoder, Heartbeat) {
    EXPECT_TRUE(std::holds_alternative<HeartbeatEvent>(
        WorkerEventDecoder::decode(QByteArray(R"({"type":"heartbeat"})"))));
}

TEST(WorkerEventDecoder, UnknownTypeIsIgnoredNotFatal) {
    const auto ev = WorkerEventDecoder::decode(QByteArray(R"({"type":"telemetry","x":1})"));
    const auto* e = std::get_if<UnknownEvent>(&ev);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->type, "telemetry");
}

TEST(WorkerEventDecoder, PlainTextLine) {
    const auto ev = WorkerEventDecoder::decode(QByteArray("🔍 Suche Jobs in Berlin..."));
    const auto* e = std::get_if<PlainTextLine>(&ev);
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->text, "🔍 Suche Jobs in Berlin...");
    EXPECT_FALSE(e->noisy);
}

TEST(WorkerEventDecoder, BrokenJsonIsPlainText) {
    const auto ev = WorkerEventDecoder::decode(QByteArray(R"({"type":"stage_change",)"));
    EXPECT_TRUE(std::holds_alternative<PlainTextLine>(ev));
}

TEST(WorkerEventDecoder, JsonArrayIsPlainText) {
    const auto ev = WorkerEventDecoder::decode(QByteArray("[1,2,3]"));
    EXPECT_TRUE(std::holds_alternative<PlainTextLine>(ev));
}

TEST(WorkerEventDecoder, KnownLibraryWarningsAreNoisy) {
    const auto ev = WorkerEventDecoder::decode(
        QByteArray("/usr/lib/python3/site-packages/urllib3/__init__.py:35: NotOpenSSLWarning: ..."));
    const auto* e = std::get_if<PlainTextLine>(&ev);
    ASSERT_NE(e, nullptr);
    EXPECT_TRUE(e->noisy);
}

TEST(WorkerEventDecoder, MalformedJobsInBatchAreSkipped) {
    const auto ev = WorkerEventDecoder::decode(QByteArray(
        R"({"type":"final_results","jobs":[{"title":"no id"},42,{"id":"3","title":"ok","company":"c"}]})"));
    const auto* e = std::get_if<FinalResultsEvent>(&ev);
    ASSERT_NE(e, nullptr);
    ASSERT_EQ(e->jobs.size(), 1u);
    EXPECT_EQ(e->jobs[0].id, "3");
}

TEST(WorkerEventDecoder, DetectMessageType) {
    QJsonObject o;
    o.insert(QStringLiteral("type"), QStringLiteral("user_approval_required"));
    EXPECT_EQ(WorkerEventDecoder::detectMessageType(o), WorkerEventDecoder::MessageType::ApprovalRequired);

    o.insert(QStringLiteral("type"), QStringLiteral("nope"));
    EXPECT_EQ(WorkerEventDecoder::detectMessageType(o), WorkerEventDecoder::MessageType::Unknown);
}
