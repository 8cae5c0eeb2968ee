#include <gtest/gtest.h>
#include "core/media_types.hpp"

TEST(MediaTypesTest, ParsesWireNames)
{
    EXPECT_EQ(MediaTypes::fromString("IMAGE"), MediaType::IMAGE);
    EXPECT_EQ(MediaTypes::fromString("video"), MediaType::VIDEO);
    EXPECT_EQ(MediaTypes::fromString("AUDIO"), MediaType::AUDIO);
}

TEST(MediaTypesTest, UnknownNamesMapToUnknown)
{
    EXPECT_EQ(MediaTypes::fromString(""), MediaType::UNKNOWN);
    EXPECT_EQ(MediaTypes::fromString("Gif"), MediaType::UNKNOWN);
}

TEST(MediaTypesTest, NamesRoundTrip)
{
    for (MediaType type : {MediaType::IMAGE, MediaType::VIDEO, MediaType::AUDIO})
    {
        EXPECT_EQ(MediaTypes::fromString(MediaTypes::getName(type)), type);
    }
}

TEST(MediaTypesTest, OnlyVisualMediaIsScorable)
{
    EXPECT_TRUE(MediaTypes::isScorable(MediaType::IMAGE));
    EXPECT_TRUE(MediaTypes::isScorable(MediaType::VIDEO));
    EXPECT_FALSE(MediaTypes::isScorable(MediaType::AUDIO));
    EXPECT_FALSE(MediaTypes::isScorable(MediaType::UNKNOWN));
}
