#include <gtest/gtest.h>
#include <vector>
#include "core/inference_error.hpp"
#include "core/score_aggregator.hpp"

class ScoreAggregatorTest : public ::testing::Test
{
};

TEST_F(ScoreAggregatorTest, VideoWithOutlierBlendsTowardPeak)
{
    AggregatedReport report = ScoreAggregator::aggregate({0.9, 0.1, 0.1, 0.1, 0.1}, MediaType::VIDEO);

    EXPECT_NEAR(report.video_score, 58.0, 1e-9);
    EXPECT_NEAR(report.peak_risk, 90.0, 1e-9);
    EXPECT_NEAR(report.mean_risk, 26.0, 1e-9);
    EXPECT_NEAR(report.gan_fingerprint, report.video_score, 1e-12);
    EXPECT_NEAR(report.risk_score, 67.6, 1e-9);
    EXPECT_NEAR(report.confidence, 90.0, 1e-9);
    // variance 0.1024 * 1000 exceeds 100
    EXPECT_NEAR(report.temporal_consistency, 0.0, 1e-9);
    EXPECT_NEAR(report.audio_score, 0.0, 1e-12);
}

TEST_F(ScoreAggregatorTest, NoBlendWhenPeakIsClose)
{
    AggregatedReport report = ScoreAggregator::aggregate({0.5, 0.55, 0.6}, MediaType::VIDEO);

    EXPECT_NEAR(report.risk_score, report.video_score, 1e-12);
}

TEST_F(ScoreAggregatorTest, SingleFrameIsFullyConsistent)
{
    AggregatedReport image = ScoreAggregator::aggregate({0.7}, MediaType::IMAGE);
    AggregatedReport video = ScoreAggregator::aggregate({0.7}, MediaType::VIDEO);

    EXPECT_NEAR(image.temporal_consistency, 100.0, 1e-12);
    EXPECT_NEAR(video.temporal_consistency, 100.0, 1e-12);
    EXPECT_NEAR(image.video_score, 70.0, 1e-9);
    EXPECT_NEAR(image.peak_risk, 70.0, 1e-9);
    EXPECT_NEAR(image.confidence, 70.0, 1e-9);
}

TEST_F(ScoreAggregatorTest, ImageIgnoresVarianceAcrossFrames)
{
    AggregatedReport report = ScoreAggregator::aggregate({0.0, 1.0}, MediaType::IMAGE);

    EXPECT_NEAR(report.temporal_consistency, 100.0, 1e-12);
}

TEST_F(ScoreAggregatorTest, SmallVarianceGivesPartialConsistency)
{
    // mean 0.5, population variance 0.0025 -> 100 - 2.5
    AggregatedReport report = ScoreAggregator::aggregate({0.45, 0.55}, MediaType::VIDEO);

    EXPECT_NEAR(report.temporal_consistency, 97.5, 1e-9);
}

TEST_F(ScoreAggregatorTest, AudioMirrorsVideoScore)
{
    AggregatedReport report = ScoreAggregator::aggregate({0.3, 0.4}, MediaType::AUDIO);

    EXPECT_NEAR(report.audio_score, report.video_score, 1e-12);
}

TEST_F(ScoreAggregatorTest, AllFieldsStayInRange)
{
    std::vector<std::vector<double>> inputs = {{0.0}, {1.0}, {0.0, 1.0, 0.0, 1.0}, {1.0, 1.0, 1.0}, {0.01, 0.99, 0.5}};
    for (const auto &input : inputs)
    {
        AggregatedReport r = ScoreAggregator::aggregate(input, MediaType::VIDEO);
        for (double v : {r.video_score, r.peak_risk, r.mean_risk, r.audio_score, r.gan_fingerprint,
                         r.temporal_consistency, r.risk_score, r.confidence})
        {
            EXPECT_GE(v, 0.0);
            EXPECT_LE(v, 100.0);
        }
    }
}

TEST_F(ScoreAggregatorTest, CustomBlendPolicy)
{
    BlendPolicy policy;
    policy.gap_threshold = 50.0;

    AggregatedReport report = ScoreAggregator::aggregate({0.9, 0.1, 0.1, 0.1, 0.1}, MediaType::VIDEO, policy);

    EXPECT_NEAR(report.risk_score, 58.0, 1e-9);
}

TEST_F(ScoreAggregatorTest, PercentileMatchesLinearInterpolation)
{
    EXPECT_NEAR(ScoreAggregator::percentile({1.0, 2.0, 3.0, 4.0}, 50.0), 2.5, 1e-12);
    EXPECT_NEAR(ScoreAggregator::percentile({4.0, 1.0, 3.0, 2.0}, 90.0), 3.7, 1e-12);
    EXPECT_NEAR(ScoreAggregator::percentile({5.0}, 90.0), 5.0, 1e-12);
}

TEST_F(ScoreAggregatorTest, RoundsToTwoDecimals)
{
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(12.345678), 12.35);
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(0.004), 0.0);
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(67.6), 67.6);
}

TEST_F(ScoreAggregatorTest, ExactTiesRoundToEven)
{
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(0.125), 0.12);
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(0.375), 0.38);
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(50.125), 50.12);
}

TEST_F(ScoreAggregatorTest, RoundingUsesExactBinaryValue)
{
    // 2.675 and 1.005 are stored just below the decimal tie
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(2.675), 2.67);
    EXPECT_DOUBLE_EQ(ScoreAggregator::roundTo2(1.005), 1.0);
}

TEST_F(ScoreAggregatorTest, EmptyInputViolatesPrecondition)
{
    try
    {
        ScoreAggregator::aggregate({}, MediaType::VIDEO);
        FAIL() << "expected InferenceException";
    }
    catch (const InferenceException &e)
    {
        EXPECT_EQ(e.code(), InferenceErrorCode::AGGREGATION_PRECONDITION);
    }
}

TEST_F(ScoreAggregatorTest, OutOfRangeProbabilityIsInvalid)
{
    try
    {
        ScoreAggregator::aggregate({0.2, 1.5}, MediaType::VIDEO);
        FAIL() << "expected InferenceException";
    }
    catch (const InferenceException &e)
    {
        EXPECT_EQ(e.code(), InferenceErrorCode::INVALID_INPUT);
    }
}
