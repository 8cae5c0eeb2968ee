#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <string>
#include <vector>
#include "core/face_crop_geometry.hpp"
#include "core/inference_error.hpp"

class FaceCropGeometryTest : public ::testing::Test
{
protected:
    static void expectInside(const CropRegion &region, int width, int height)
    {
        EXPECT_GE(region.x, 0);
        EXPECT_GE(region.y, 0);
        EXPECT_GT(region.width, 0);
        EXPECT_GT(region.height, 0);
        EXPECT_LE(region.x + region.width, width);
        EXPECT_LE(region.y + region.height, height);
    }
};

TEST_F(FaceCropGeometryTest, CentredFaceGetsPaddedSquare)
{
    CropRegion region = FaceCropGeometry::computeCropRegion(100, 100, BoundingBox(40, 40, 20, 20), 30.0);

    EXPECT_EQ(region, CropRegion(37, 37, 26, 26));
}

TEST_F(FaceCropGeometryTest, PaddedSizeUsesLargerSide)
{
    EXPECT_EQ(FaceCropGeometry::paddedSize(BoundingBox(0, 0, 100, 50), 30.0), 130);
    EXPECT_EQ(FaceCropGeometry::paddedSize(BoundingBox(0, 0, 33, 10), 30.0), 42);
    EXPECT_EQ(FaceCropGeometry::paddedSize(BoundingBox(0, 0, 20, 20), 0.0), 20);
}

TEST_F(FaceCropGeometryTest, FaceAtCornerSlidesInsteadOfShrinking)
{
    CropRegion region = FaceCropGeometry::computeCropRegion(200, 200, BoundingBox(0, 0, 40, 40), 30.0);

    EXPECT_EQ(region, CropRegion(0, 0, 52, 52));
}

TEST_F(FaceCropGeometryTest, FaceAtFarCornerSlidesBack)
{
    CropRegion region = FaceCropGeometry::computeCropRegion(200, 150, BoundingBox(160, 110, 40, 40), 30.0);

    EXPECT_EQ(region.width, 52);
    EXPECT_EQ(region.height, 52);
    EXPECT_EQ(region.x + region.width, 200);
    EXPECT_EQ(region.y + region.height, 150);
}

TEST_F(FaceCropGeometryTest, PaddedSizeLargerThanImageSpansAxis)
{
    CropRegion region = FaceCropGeometry::computeCropRegion(120, 60, BoundingBox(30, 5, 50, 50), 30.0);

    // 65 > 60, so the vertical axis is the whole image and the crop is not square
    EXPECT_EQ(region.y, 0);
    EXPECT_EQ(region.height, 60);
    EXPECT_EQ(region.width, 65);
    expectInside(region, 120, 60);
}

TEST_F(FaceCropGeometryTest, CropStaysInsideForEveryOverlappingBox)
{
    const int width = 64;
    const int height = 48;
    for (int x = -10; x < width; x += 3)
    {
        for (int y = -10; y < height; y += 3)
        {
            for (int size = 1; size <= 40; size += 6)
            {
                BoundingBox face(x, y, size, size + 2);
                if (x + face.width <= 0 || y + face.height <= 0)
                {
                    continue;
                }

                CropRegion region = FaceCropGeometry::computeCropRegion(width, height, face, 30.0);
                SCOPED_TRACE("face " + std::to_string(x) + "," + std::to_string(y) + " size " + std::to_string(size));
                expectInside(region, width, height);

                long long padded = FaceCropGeometry::paddedSize(face, 30.0);
                if (padded <= std::min(width, height))
                {
                    EXPECT_EQ(region.width, region.height);
                    EXPECT_EQ(region.width, padded);
                }
            }
        }
    }
}

TEST_F(FaceCropGeometryTest, HugeOverlappingBoxClampsToImage)
{
    BoundingBox face(10, 10, 1800000000, 1800000000);
    EXPECT_EQ(FaceCropGeometry::paddedSize(face, 30.0), 2340000000LL);

    CropRegion region = FaceCropGeometry::computeCropRegion(100, 100, face, 30.0);

    EXPECT_EQ(region, CropRegion(0, 0, 100, 100));
    expectInside(region, 100, 100);
}

TEST_F(FaceCropGeometryTest, ExtremePaddingClampsToImage)
{
    CropRegion region = FaceCropGeometry::computeCropRegion(80, 60, BoundingBox(20, 20, 10, 10), 1e300);

    EXPECT_EQ(region, CropRegion(0, 0, 80, 60));
}

TEST_F(FaceCropGeometryTest, PaddingCompoundsWhenReapplied)
{
    CropRegion first = FaceCropGeometry::computeCropRegion(400, 400, BoundingBox(150, 150, 100, 100), 30.0);
    CropRegion second = FaceCropGeometry::computeCropRegion(400, 400, first, 30.0);

    EXPECT_GT(second.width, first.width);
}

TEST_F(FaceCropGeometryTest, MalformedArgumentsAreRejected)
{
    const std::vector<std::function<void()>> calls = {
        []
        { FaceCropGeometry::computeCropRegion(0, 100, BoundingBox(10, 10, 10, 10)); },
        []
        { FaceCropGeometry::computeCropRegion(100, 100, BoundingBox(10, 10, 0, 10)); },
        []
        { FaceCropGeometry::computeCropRegion(100, 100, BoundingBox(10, 10, 10, 10), -5.0); },
        []
        { FaceCropGeometry::computeCropRegion(100, 100, BoundingBox(150, 10, 10, 10)); },
        []
        { FaceCropGeometry::computeCropRegion(100, 100, BoundingBox(-20, 10, 10, 10)); }};

    for (const auto &call : calls)
    {
        try
        {
            call();
            ADD_FAILURE() << "expected InferenceException";
        }
        catch (const InferenceException &e)
        {
            EXPECT_EQ(e.code(), InferenceErrorCode::INVALID_INPUT);
        }
    }
}
