#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "core/fake_probability_extractor.hpp"
#include "core/inference_error.hpp"

class FakeProbabilityExtractorTest : public ::testing::Test
{
protected:
    FakeProbabilityExtractor extractor_;
};

TEST_F(FakeProbabilityExtractorTest, FakeLabelWinsRegardlessOfOrder)
{
    EXPECT_NEAR(extractor_.extract({LabelScore("Real", 0.8), LabelScore("Fake", 0.2)}), 0.2, 1e-12);
    EXPECT_NEAR(extractor_.extract({LabelScore("Fake", 0.2), LabelScore("Real", 0.8)}), 0.2, 1e-12);
}

TEST_F(FakeProbabilityExtractorTest, RealLabelAloneIsInverted)
{
    EXPECT_NEAR(extractor_.extract({LabelScore("Real", 0.75)}), 0.25, 1e-12);
}

TEST_F(FakeProbabilityExtractorTest, MatchingIsCaseInsensitiveSubstring)
{
    EXPECT_NEAR(extractor_.extract({LabelScore("LABEL_DEEPFAKE", 0.9)}), 0.9, 1e-12);
    EXPECT_NEAR(extractor_.extract({LabelScore("Synthetic image", 0.4)}), 0.4, 1e-12);
    EXPECT_NEAR(extractor_.extract({LabelScore("authentic", 0.7)}), 0.3, 1e-12);
}

TEST_F(FakeProbabilityExtractorTest, UnrecognisedLabelsUseFirstScore)
{
    EXPECT_NEAR(extractor_.extract({LabelScore("LABEL_1", 0.65), LabelScore("LABEL_0", 0.35)}), 0.65, 1e-12);
}

TEST_F(FakeProbabilityExtractorTest, EmptyResultIsUncertain)
{
    EXPECT_DOUBLE_EQ(extractor_.extract({}), FakeProbabilityExtractor::UNCERTAIN_PROBABILITY);
}

TEST_F(FakeProbabilityExtractorTest, ScoresAreClampedToUnitInterval)
{
    EXPECT_DOUBLE_EQ(extractor_.extract({LabelScore("Fake", 1.4)}), 1.0);
    EXPECT_DOUBLE_EQ(extractor_.extract({LabelScore("Real", -0.2)}), 1.0);
}

TEST_F(FakeProbabilityExtractorTest, NonFiniteScoreIsInvalidInput)
{
    try
    {
        extractor_.extract({LabelScore("Fake", std::numeric_limits<double>::quiet_NaN())});
        FAIL() << "expected InferenceException";
    }
    catch (const InferenceException &e)
    {
        EXPECT_EQ(e.code(), InferenceErrorCode::INVALID_INPUT);
    }
}

TEST_F(FakeProbabilityExtractorTest, CustomMapperOverridesVocabulary)
{
    FakeProbabilityExtractor extractor([](const std::string &label)
                                       {
        if (label == "LABEL_1")
            return SemanticLabel::fake(label);
        if (label == "LABEL_0")
            return SemanticLabel::real(label);
        return SemanticLabel::unknown(label); });

    EXPECT_NEAR(extractor.extract({LabelScore("LABEL_0", 0.9), LabelScore("LABEL_1", 0.1)}), 0.1, 1e-12);
    EXPECT_NEAR(extractor.extract({LabelScore("LABEL_0", 0.9)}), 0.1, 1e-12);
}

TEST(SubstringLabelMapperTest, KeepsRawText)
{
    SemanticLabel label = FakeProbabilityExtractor::substringLabelMapper("Neutral");

    EXPECT_EQ(label.kind, SemanticLabel::Kind::UNKNOWN);
    EXPECT_EQ(label.raw_text, "Neutral");
}
