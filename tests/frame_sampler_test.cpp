#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "core/frame_sampler.hpp"
#include "core/inference_error.hpp"

namespace
{
    std::vector<std::string> framePaths(size_t count)
    {
        std::vector<std::string> paths;
        for (size_t i = 0; i < count; ++i)
        {
            paths.push_back("/frames/frame_" + std::to_string(i) + ".jpg");
        }
        return paths;
    }
}

TEST(FrameSamplerTest, HundredFramesCappedAtThirty)
{
    auto indices = FrameSampler::sampleIndices(100, 30);

    ASSERT_EQ(indices.size(), 30u);
    // stride floor(100 / 30) = 3
    EXPECT_EQ(indices.front(), 0u);
    EXPECT_EQ(indices[1], 3u);
    EXPECT_EQ(indices.back(), 87u);
}

TEST(FrameSamplerTest, AbsentLimitKeepsEverything)
{
    auto frames = framePaths(100);

    EXPECT_EQ(FrameSampler::sample(frames, std::nullopt), frames);
}

TEST(FrameSamplerTest, FewerFramesThanLimitAreKept)
{
    auto frames = framePaths(10);

    EXPECT_EQ(FrameSampler::sample(frames, 30), frames);
}

TEST(FrameSamplerTest, StrideOfOneTruncatesTail)
{
    // floor(45 / 30) = 1: the first 30 frames, the last 15 are left out
    auto indices = FrameSampler::sampleIndices(45, 30);

    ASSERT_EQ(indices.size(), 30u);
    EXPECT_EQ(indices.back(), 29u);
}

TEST(FrameSamplerTest, SamplePreservesOrder)
{
    auto sampled = FrameSampler::sample(framePaths(61), 30);

    ASSERT_EQ(sampled.size(), 30u);
    EXPECT_EQ(sampled[0], "/frames/frame_0.jpg");
    EXPECT_EQ(sampled[1], "/frames/frame_2.jpg");
    EXPECT_EQ(sampled[29], "/frames/frame_58.jpg");
}

TEST(FrameSamplerTest, EmptyInputGivesEmptyOutput)
{
    EXPECT_TRUE(FrameSampler::sampleIndices(0, 30).empty());
}

TEST(FrameSamplerTest, ZeroLimitIsInvalid)
{
    EXPECT_THROW(FrameSampler::sampleIndices(10, 0), InferenceException);
}
