#include <gtest/gtest.h>

#include <set>

#include "app/JobMerger.hpp"
#include "fakes.hpp"

using jh::client::app::JobMerger;
using jh::client::app::MergeStats;
using jh::client::domain::Job;
using jh::client::test::makeJob;

namespace {

std::vector<Job> sample() {
    return {
        makeJob("1", "Gärtner", "Grün GmbH", "https://jobs.example/1"),
        makeJob("2", "Landschaftsgärtner", "Park AG", "https://jobs.example/2"),
        makeJob("3", "Florist", "Blume KG"),
    };
}

std::vector<std::string> ids(const std::vector<Job>& jobs) {
    std::vector<std::string> out;
    for (const auto& j : jobs) {
        out.push_back(j.id);
    }
    return out;
}

} // namespace

TEST(JobMerger, MergeWithEmptyBatchKeepsCollection) {
    const auto x = sample();
    EXPECT_EQ(ids(JobMerger::merge(x, {})), ids(x));
}

TEST(JobMerger, MergeWithItselfKeepsCollection) {
    const auto x = sample();
    MergeStats stats;
    const auto merged = JobMerger::merge(x, x, &stats);
    EXPECT_EQ(ids(merged), ids(x));
    EXPECT_EQ(stats.updated, 3u);
    EXPECT_EQ(stats.added, 0u);
}

TEST(JobMerger, MergingSameBatchTwiceEqualsOnce) {
    const auto x = sample();
    const std::vector<Job> batch{makeJob("9", "Baumpfleger", "Wald eG", "https://jobs.example/9")};
    const auto once  = JobMerger::merge(x, batch);
    const auto twice = JobMerger::merge(once, batch);
    EXPECT_EQ(ids(once), ids(twice));
    EXPECT_EQ(once.size(), 4u);
}

TEST(JobMerger, SameIdOverwritesFields) {
    Job a = makeJob("7", "Old title", "Old company", "https://a");
    a.relevanceScore = 1.0;
    Job b = makeJob("7", "New title", "New company", "https://b");
    b.relevanceScore = 8.5;

    const auto merged = JobMerger::merge({a}, {b});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].title, "New title");
    EXPECT_EQ(merged[0].company, "New company");
    EXPECT_EQ(merged[0].url, "https://b");
    EXPECT_DOUBLE_EQ(merged[0].relevanceScore, 8.5);
}

TEST(JobMerger, SameIdKeepsLocalHiddenFlagWhenIncomingHasNone) {
    Job a = makeJob("7", "Gärtner", "Grün GmbH");
    a.hidden = true;
    Job b = makeJob("7", "Gärtner", "Grün GmbH");

    const auto merged = JobMerger::merge({a}, {b});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_TRUE(merged[0].isHidden());
}

TEST(JobMerger, SameIdTakesIncomingHiddenFlag) {
    Job a = makeJob("7", "Gärtner", "Grün GmbH");
    a.hidden = true;
    Job b = makeJob("7", "Gärtner", "Grün GmbH");
    b.hidden = false;

    const auto merged = JobMerger::merge({a}, {b});
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_FALSE(merged[0].isHidden());
}

TEST(JobMerger, SameUrlDifferentCaseIsDuplicate) {
    const Job a = makeJob("1", "Gärtner", "Grün GmbH", "https://Jobs.Example/42");
    const Job b = makeJob("2", "Something else", "Other", "https://jobs.example/42");

    MergeStats stats;
    const auto merged = JobMerger::merge({a}, {b}, &stats);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].id, "1");
    EXPECT_EQ(stats.skippedByUrl, 1u);
}

TEST(JobMerger, SameSignatureIsDuplicate) {
    const Job a = makeJob("1", "Gärtner  (m/w/d)", "Grün GmbH", "https://a");
    const Job b = makeJob("2", " gärtner (M/W/D) ", "GRÜN   GmbH", "https://b");

    MergeStats stats;
    const auto merged = JobMerger::merge({a}, {b}, &stats);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].id, "1");
    EXPECT_EQ(stats.skippedBySignature, 1u);
}

TEST(JobMerger, EmptyUrlsAreNotTreatedAsEqual) {
    const Job a = makeJob("1", "Gärtner", "Grün GmbH");
    const Job b = makeJob("2", "Florist", "Blume KG");

    const auto merged = JobMerger::merge({a}, {b});
    EXPECT_EQ(merged.size(), 2u);
}

TEST(JobMerger, DuplicatesWithinOneBatchAreSuppressed) {
    const std::vector<Job> batch{
        makeJob("1", "Gärtner", "Grün GmbH", "https://a"),
        makeJob("2", "Gärtner", "Grün GmbH", "https://b"),
        makeJob("3", "Florist", "Blume KG", "https://A"),
    };

    const auto merged = JobMerger::merge({}, batch);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].id, "1");
}

TEST(JobMerger, ResultNeverHoldsCollidingKeys) {
    std::vector<Job> existing = sample();
    const std::vector<Job> incoming{
        makeJob("1", "Gärtner", "Grün GmbH", "https://jobs.example/1"),
        makeJob("4", "gärtner", "grün gmbh", "https://elsewhere/4"),
        makeJob("5", "Koch", "Küche AG", "https://JOBS.example/2"),
        makeJob("6", "Koch", "Küche AG", "https://jobs.example/6"),
        makeJob("6", "Koch", "Küche AG", "https://jobs.example/6"),
    };

    const auto merged = JobMerger::merge(existing, incoming);

    std::set<std::string> seenIds;
    std::set<std::string> seenUrls;
    std::set<std::string> seenSignatures;
    for (const auto& j : merged) {
        EXPECT_TRUE(seenIds.insert(j.id).second) << j.id;
        const auto url = JobMerger::normalizedUrl(j);
        if (!url.empty()) {
            EXPECT_TRUE(seenUrls.insert(url).second) << url;
        }
        EXPECT_TRUE(seenSignatures.insert(JobMerger::signature(j)).second) << JobMerger::signature(j);
    }
    EXPECT_EQ(merged.size(), 4u);
}

TEST(JobMerger, ReemittedIdCannotTakeUrlOfAnotherRecord) {
    const std::vector<Job> existing{makeJob("1", "Gärtner", "Grün GmbH", "https://a")};
    const std::vector<Job> incoming{
        makeJob("2", "Florist", "Blume KG", "https://b"),
        makeJob("1", "Gärtner", "Grün GmbH", "https://B"),
    };

    MergeStats stats;
    const auto merged = JobMerger::merge(existing, incoming, &stats);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].id, "1");
    EXPECT_EQ(merged[0].url, "https://a");
    EXPECT_EQ(merged[1].url, "https://b");
    EXPECT_EQ(stats.updated, 1u);
    EXPECT_EQ(stats.keptKeyFields, 1u);
}

TEST(JobMerger, ReemittedIdCannotTakeSignatureOfAnotherRecord) {
    Job a = makeJob("1", "Gärtner", "Grün GmbH", "https://a");
    Job again = makeJob("1", "Florist", "Blume KG", "https://a");
    again.relevanceScore = 7.0;
    const std::vector<Job> incoming{makeJob("2", "Florist", "Blume KG", "https://b"), again};

    const auto merged = JobMerger::merge({a}, incoming);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].title, "Gärtner");
    EXPECT_EQ(merged[0].company, "Grün GmbH");
    EXPECT_DOUBLE_EQ(merged[0].relevanceScore, 7.0);
    EXPECT_NE(JobMerger::signature(merged[0]), JobMerger::signature(merged[1]));
}

TEST(JobMerger, ChangedKeysOfReemittedIdAreReindexed) {
    const std::vector<Job> existing{makeJob("1", "Gärtner", "Grün GmbH", "https://a")};
    const std::vector<Job> incoming{
        makeJob("1", "Koch", "Küche AG", "https://new"),
        // old keys are free again, new keys are taken
        makeJob("2", "Gärtner", "Grün GmbH", "https://a"),
        makeJob("3", "Bäcker", "Brot eG", "https://NEW"),
    };

    MergeStats stats;
    const auto merged = JobMerger::merge(existing, incoming, &stats);
    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].url, "https://new");
    EXPECT_EQ(merged[1].id, "2");
    EXPECT_EQ(stats.skippedByUrl, 1u);
    EXPECT_EQ(stats.keptKeyFields, 0u);
}

TEST(JobMerger, ReemittedIdsWithShiftedKeysNeverCollide) {
    const std::vector<Job> existing{
        makeJob("1", "Gärtner", "Grün GmbH", "https://a"),
        makeJob("2", "Florist", "Blume KG", "https://b"),
    };
    const std::vector<Job> incoming{
        makeJob("3", "Koch", "Küche AG", "https://c"),
        makeJob("1", "Florist", "Blume KG", "https://c"),
        makeJob("2", "Koch", "Küche AG", "https://a"),
    };

    const auto merged = JobMerger::merge(existing, incoming);

    std::set<std::string> seenIds;
    std::set<std::string> seenUrls;
    std::set<std::string> seenSignatures;
    for (const auto& j : merged) {
        EXPECT_TRUE(seenIds.insert(j.id).second) << j.id;
        EXPECT_TRUE(seenUrls.insert(JobMerger::normalizedUrl(j)).second) << j.url;
        EXPECT_TRUE(seenSignatures.insert(JobMerger::signature(j)).second) << JobMerger::signature(j);
    }
    EXPECT_EQ(merged.size(), 3u);
}

TEST(JobMerger, RemoveDuplicatesKeepsFirstOccurrence) {
    const std::vector<Job> jobs{
        makeJob("1", "Gärtner", "Grün GmbH", "https://a"),
        makeJob("2", "Florist", "Blume KG", "https://b"),
        makeJob("3", "GÄRTNER", "grün gmbh", "https://c"),
    };

    MergeStats stats;
    const auto unique = JobMerger::removeDuplicates(jobs, &stats);
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0].id, "1");
    EXPECT_EQ(unique[1].id, "2");
    EXPECT_EQ(stats.skippedBySignature, 1u);
}

TEST(JobMerger, SignatureIsCaseAndWhitespaceInsensitive) {
    EXPECT_EQ(JobMerger::signature(makeJob("1", "  Senior   Gärtner ", "Grün\tGmbH")),
              JobMerger::signature(makeJob("2", "senior gärtner", "grün gmbh")));
}
