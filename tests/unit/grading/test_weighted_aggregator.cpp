/**
 * @file test_weighted_aggregator.cpp
 * @brief Unit tests for Grading/WeightedAggregator
 */

#include <gtest/gtest.h>
#include <PathoMorph/Grading/WeightedAggregator.h>
#include <PathoMorph/Core/Exception.h>

#include <limits>
#include <vector>

using namespace Patho::Morph;
using namespace Patho::Morph::Grading;

namespace {

AlgorithmResult MakeResult(const std::string& name, double score, double confidence,
                           bool insufficient = false) {
    AlgorithmResult r;
    r.name = name;
    r.score = score;
    r.confidence = confidence;
    r.insufficientSamples = insufficient;
    return r;
}

} // anonymous namespace

class WeightedAggregatorTest : public ::testing::Test {
protected:
    WeightedAggregator aggregator_{{{"a", 0.5}, {"b", 0.3}, {"c", 0.2}}};
};

// ============================================================================
// Construction
// ============================================================================

TEST(WeightTableTest, RejectsInvalidTables) {
    EXPECT_THROW(WeightedAggregator(std::vector<WeightEntry>{}), ConfigurationException);
    EXPECT_THROW(WeightedAggregator({{"", 1.0}}), ConfigurationException);
    EXPECT_THROW(WeightedAggregator({{"a", 0.5}, {"a", 0.5}}), ConfigurationException);
    EXPECT_THROW(WeightedAggregator({{"a", 1.2}, {"b", -0.2}}), ConfigurationException);
    EXPECT_THROW(WeightedAggregator({{"a", std::numeric_limits<double>::quiet_NaN()}}),
                 ConfigurationException);
    EXPECT_THROW(WeightedAggregator({{"a", 0.5}, {"b", 0.4}}), ConfigurationException);
}

TEST(WeightTableTest, SumWithinEpsilonAccepted) {
    EXPECT_NO_THROW(WeightedAggregator({{"a", 0.5}, {"b", 0.5005}}));
    EXPECT_THROW(WeightedAggregator({{"a", 0.5}, {"b", 0.5005}}, 1e-4), ConfigurationException);
}

TEST(WeightTableTest, NormalizeWeights) {
    auto weights = NormalizeWeights({{"a", 2.0}, {"b", 1.0}, {"c", 1.0}});
    ASSERT_EQ(weights.size(), 3u);
    EXPECT_DOUBLE_EQ(weights[0].weight, 0.5);
    EXPECT_DOUBLE_EQ(weights[1].weight, 0.25);
    EXPECT_EQ(weights[2].name, "c");
    EXPECT_NO_THROW(WeightedAggregator{weights});

    EXPECT_THROW(NormalizeWeights({{"a", 0.0}}), ConfigurationException);
    EXPECT_THROW(NormalizeWeights({{"a", -1.0}, {"b", 2.0}}), ConfigurationException);
}

TEST_F(WeightedAggregatorTest, WeightOf) {
    EXPECT_DOUBLE_EQ(aggregator_.WeightOf("b"), 0.3);
    EXPECT_DOUBLE_EQ(aggregator_.WeightOf("zzz"), 0.0);
}

// ============================================================================
// Aggregation
// ============================================================================

TEST_F(WeightedAggregatorTest, WeightedSums) {
    AggregateResult agg = aggregator_.Aggregate({
        MakeResult("c", 0.0, 0.4),
        MakeResult("a", 1.0, 0.8),
        MakeResult("b", 0.5, 0.6)
    });

    EXPECT_NEAR(agg.overallScore, 0.65, 1e-12);
    EXPECT_NEAR(agg.overallConfidence, 0.76, 1e-12);
    EXPECT_EQ(agg.insufficientCount, 0);

    // Results come back in weight-table order with weights attached
    ASSERT_EQ(agg.results.size(), 3u);
    EXPECT_EQ(agg.results[0].name, "a");
    EXPECT_EQ(agg.results[1].name, "b");
    EXPECT_EQ(agg.results[2].name, "c");
    EXPECT_DOUBLE_EQ(agg.results[0].weight, 0.5);
    EXPECT_DOUBLE_EQ(agg.results[2].weight, 0.2);
}

TEST_F(WeightedAggregatorTest, ConfidenceCapped) {
    AggregateResult agg = aggregator_.Aggregate({
        MakeResult("a", 1.0, 1.0), MakeResult("b", 1.0, 1.0), MakeResult("c", 1.0, 1.0)
    });
    EXPECT_NEAR(agg.overallScore, 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(agg.overallConfidence, 0.95);
}

TEST_F(WeightedAggregatorTest, ZeroConfidenceGetsBonus) {
    AggregateResult agg = aggregator_.Aggregate({
        MakeResult("a", 0.0, 0.0), MakeResult("b", 0.0, 0.0), MakeResult("c", 0.0, 0.0)
    });
    EXPECT_DOUBLE_EQ(agg.overallScore, 0.0);
    EXPECT_DOUBLE_EQ(agg.overallConfidence, 0.1);
}

TEST_F(WeightedAggregatorTest, CountsInsufficient) {
    AggregateResult agg = aggregator_.Aggregate({
        MakeResult("a", 0.1, 0.2, true), MakeResult("b", 0.5, 0.5), MakeResult("c", 0.1, 0.2, true)
    });
    EXPECT_EQ(agg.insufficientCount, 2);
}

TEST_F(WeightedAggregatorTest, RejectsMismatchedResults) {
    EXPECT_THROW(aggregator_.Aggregate({MakeResult("a", 0.1, 0.1), MakeResult("b", 0.1, 0.1)}),
                 InvalidArgumentException);
    EXPECT_THROW(aggregator_.Aggregate({MakeResult("a", 0.1, 0.1), MakeResult("b", 0.1, 0.1),
                                        MakeResult("c", 0.1, 0.1), MakeResult("d", 0.1, 0.1)}),
                 InvalidArgumentException);
    EXPECT_THROW(aggregator_.Aggregate({MakeResult("a", 0.1, 0.1), MakeResult("a", 0.1, 0.1),
                                        MakeResult("c", 0.1, 0.1)}),
                 InvalidArgumentException);
}

TEST_F(WeightedAggregatorTest, OverallScoreBounded) {
    for (int i = 0; i <= 10; ++i) {
        double s = i / 10.0;
        AggregateResult agg = aggregator_.Aggregate({
            MakeResult("a", s, s), MakeResult("b", 1.0 - s, s), MakeResult("c", s * s, 1.0 - s)
        });
        EXPECT_GE(agg.overallScore, 0.0);
        EXPECT_LE(agg.overallScore, 1.0);
        EXPECT_GE(agg.overallConfidence, 0.1 - 1e-12);
        EXPECT_LE(agg.overallConfidence, 0.95);
    }
}
