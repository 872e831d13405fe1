#include <gtest/gtest.h>
#include "analytics/anomaly_detector.hpp"
#include <cmath>

using namespace sem;

namespace {

DocumentRecord make_doc(const std::string& id, long long length, int category = 1) {
    DocumentRecord doc;
    doc.id = id;
    doc.title = "Doc " + id;
    doc.content_length = length;
    doc.word_count = length / 5;
    doc.category_id = category;
    doc.created_at = parse_iso8601("2024-03-01");
    return doc;
}

} // namespace

// ==========================================
// Baseline Tests
// ==========================================

TEST(FeatureBaselineTest, PopulationStatistics) {
    auto b = FeatureBaseline::from_values({2, 4, 4, 4, 5, 5, 7, 9});
    EXPECT_DOUBLE_EQ(b.mean, 5.0);
    EXPECT_DOUBLE_EQ(b.std_dev, 2.0);
    EXPECT_EQ(b.samples, 8);
    EXPECT_DOUBLE_EQ(b.z_score(9.0, 1e-9), 2.0);
}

TEST(FeatureBaselineTest, FloorAppliesToFlatFeature) {
    auto b = FeatureBaseline::from_values({1, 1});
    EXPECT_DOUBLE_EQ(b.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(b.z_score(3.0, 1.0), 2.0);

    auto empty = FeatureBaseline::from_values({});
    EXPECT_EQ(empty.samples, 0);
}

// ==========================================
// Detection Tests
// ==========================================

TEST(AnomalyDetectorTest, LengthOutlier) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) corpus.add_document(make_doc("n" + std::to_string(i), 1000));
    corpus.add_document(make_doc("long", 10000));

    auto results = AnomalyDetector().detect(corpus);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].document_id, "long");
    EXPECT_EQ(results[0].anomaly_type, AnomalyType::LENGTH_ANOMALY);
    EXPECT_NEAR(results[0].anomaly_score, std::sqrt(11.0), 1e-6);
    EXPECT_NE(results[0].explanation.find("10000 characters"), std::string::npos);
}

TEST(AnomalyDetectorTest, EmbeddingFarFromCentroid) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) {
        corpus.add_document(make_doc("n" + std::to_string(i), 1000), {1.0f, 0.0f, 0.0f});
    }
    corpus.add_document(make_doc("odd", 1000), {0.0f, 0.0f, 1.0f});

    auto results = AnomalyDetector().detect(corpus);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].document_id, "odd");
    EXPECT_EQ(results[0].anomaly_type, AnomalyType::CONTENT_OUTLIER);
    EXPECT_NEAR(results[0].anomaly_score, std::sqrt(11.0), 1e-3);
    EXPECT_EQ(results[0].to_json()["anomaly_type"], "content_outlier");
}

TEST(AnomalyDetectorTest, UniformCorpusHasNoAnomalies) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 12; ++i) {
        corpus.add_document(make_doc("n" + std::to_string(i), 1000), {0.5f, 0.5f});
    }
    EXPECT_TRUE(AnomalyDetector().detect(corpus).empty());
}

TEST(AnomalyDetectorTest, SmallCorpusCannotClearFloor) {
    // With three documents no z-score can exceed sqrt(2)
    CorpusSnapshot corpus;
    corpus.add_document(make_doc("a", 100));
    corpus.add_document(make_doc("b", 100));
    corpus.add_document(make_doc("c", 100000));
    EXPECT_TRUE(AnomalyDetector().detect(corpus).empty());
}

TEST(AnomalyDetectorTest, CategoryRestrictsBaseline) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) corpus.add_document(make_doc("n" + std::to_string(i), 1000, 1));
    corpus.add_document(make_doc("long", 10000, 2));

    EXPECT_TRUE(AnomalyDetector().detect(corpus, 1).empty());
    EXPECT_EQ(AnomalyDetector().detect(corpus).size(), 1);
}

TEST(AnomalyDetectorTest, FloorIsConfigurable) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) corpus.add_document(make_doc("n" + std::to_string(i), 1000));
    corpus.add_document(make_doc("long", 10000));

    AnomalyConfig config;
    config.significance_floor = 4.0;
    EXPECT_TRUE(AnomalyDetector(config).detect(corpus).empty());
}

// ==========================================
// Per-Feature Detection Tests
// ==========================================

TEST(AnomalyDetectorTest, TinyDifferencesStayBelowSpreadFloors) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 10; ++i) {
        corpus.add_document(make_doc("n" + std::to_string(i), 1000), {1.0f, 0.0f, 0.0f});
    }

    // One second later
    DocumentRecord late = make_doc("late", 1000);
    late.created_at = parse_iso8601("2024-03-01T00:00:01");
    corpus.add_document(late, {1.0f, 0.0f, 0.0f});

    // One character longer, almost the same direction
    DocumentRecord longer = make_doc("longer", 1001);
    longer.word_count = 200;
    corpus.add_document(longer, {1.0f, 0.001f, 0.0f});

    EXPECT_TRUE(AnomalyDetector().detect(corpus).empty());
}

TEST(AnomalyDetectorTest, TemporalOutlier) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) corpus.add_document(make_doc("n" + std::to_string(i), 1000));

    DocumentRecord late = make_doc("late", 1000);
    late.created_at = days_before(parse_iso8601("2024-03-01"), -300);
    corpus.add_document(late);

    auto results = AnomalyDetector().detect(corpus);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].document_id, "late");
    EXPECT_EQ(results[0].anomaly_type, AnomalyType::TEMPORAL_ANOMALY);
    EXPECT_NEAR(results[0].anomaly_score, std::sqrt(11.0), 1e-6);

    // A spread floor wider than the gap hides it
    AnomalyConfig config;
    config.min_temporal_std_days = 1000.0;
    EXPECT_TRUE(AnomalyDetector(config).detect(corpus).empty());
}

TEST(AnomalyDetectorTest, StyleOutlier) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 11; ++i) corpus.add_document(make_doc("n" + std::to_string(i), 1000));

    // Same length, twice the average word length
    DocumentRecord wordy = make_doc("wordy", 1000);
    wordy.word_count = 100;
    corpus.add_document(wordy);

    auto results = AnomalyDetector().detect(corpus);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].document_id, "wordy");
    EXPECT_EQ(results[0].anomaly_type, AnomalyType::STYLE_DEVIATION);
    EXPECT_NEAR(results[0].anomaly_score, std::sqrt(11.0), 1e-6);
    EXPECT_NE(results[0].explanation.find("word length"), std::string::npos);
}

TEST(AnomalyDetectorTest, TopicMismatch) {
    CorpusSnapshot corpus;
    for (int i = 0; i < 6; ++i) {
        DocumentRecord x = make_doc("x" + std::to_string(i), 1000);
        x.topics = {"Rust"};
        corpus.add_document(x, {1.0f, 0.0f, 0.0f});

        DocumentRecord y = make_doc("y" + std::to_string(i), 1000);
        y.topics = {"Spark"};
        corpus.add_document(y, {0.0f, 1.0f, 0.0f});
    }

    // Tagged Rust but written like the Spark documents
    DocumentRecord mislabeled = make_doc("mislabeled", 1000);
    mislabeled.topics = {"rust"};
    corpus.add_document(mislabeled, {0.0f, 1.0f, 0.0f});

    auto results = AnomalyDetector().detect(corpus);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].document_id, "mislabeled");
    EXPECT_EQ(results[0].anomaly_type, AnomalyType::TOPIC_MISMATCH);
    EXPECT_NEAR(results[0].anomaly_score, 3.46, 0.05);
    EXPECT_EQ(results[0].to_json()["anomaly_type"], "topic_mismatch");
}
