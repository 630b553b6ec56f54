/**
 * @file test_distance_transform.cpp
 * @brief Unit tests for Internal/DistanceTransform.h
 */

#include <gtest/gtest.h>
#include <CellDeclump/Internal/DistanceTransform.h>

#include <cmath>
#include <limits>

using namespace Cell::Declump;
using namespace Cell::Declump::Internal;

class DistanceTransformTest : public ::testing::Test {
protected:
    // Filled rectangle [y0, y1) x [x0, x1) in an h x w mask
    static SeedMask Rect(int32_t h, int32_t w, int32_t y0, int32_t y1, int32_t x0, int32_t x1) {
        auto mask = SeedMask::Create2D(h, w);
        for (int32_t y = y0; y < y1; ++y) {
            for (int32_t x = x0; x < x1; ++x) {
                mask.At(y, x) = 1;
            }
        }
        return mask;
    }
};

TEST_F(DistanceTransformTest, BackgroundIsZero) {
    auto mask = Rect(9, 9, 2, 7, 2, 7);
    auto dist = DistanceTransformEDT(mask);
    EXPECT_FLOAT_EQ(dist.At(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(dist.At(1, 4), 0.0f);
}

TEST_F(DistanceTransformTest, SquareCentre) {
    auto mask = Rect(9, 9, 2, 7, 2, 7);
    auto dist = DistanceTransformEDT(mask);
    EXPECT_FLOAT_EQ(dist.At(2, 2), 1.0f);
    EXPECT_FLOAT_EQ(dist.At(3, 4), 2.0f);
    EXPECT_FLOAT_EQ(dist.At(4, 4), 3.0f);
    EXPECT_FLOAT_EQ(dist.Max(), 3.0f);
}

TEST_F(DistanceTransformTest, IsEuclidean) {
    // Single background voxel in the corner
    auto mask = SeedMask::Create2D(6, 6, 1);
    mask.At(0, 0) = 0;
    auto dist = DistanceTransformEDT(mask);
    EXPECT_NEAR(dist.At(3, 4), 5.0f, 1e-5);
    EXPECT_NEAR(dist.At(1, 1), std::sqrt(2.0f), 1e-5);
}

TEST_F(DistanceTransformTest, NoBackgroundUsesExterior) {
    auto mask = SeedMask::Create2D(5, 5, 1);
    auto dist = DistanceTransformEDT(mask);
    EXPECT_FLOAT_EQ(dist.At(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(dist.At(2, 2), 3.0f);
}

TEST_F(DistanceTransformTest, Anisotropic) {
    auto stack = SeedMask::Create3D(5, 5, 5, 1);
    stack.At(0, 2, 2) = 0;
    auto dist = DistanceTransformEDT(stack, {2.0, 1.0, 1.0});
    EXPECT_NEAR(dist.At(1, 2, 2), 2.0f, 1e-5);
    EXPECT_NEAR(dist.At(0, 2, 4), 2.0f, 1e-5);
}

TEST_F(DistanceTransformTest, InvalidSpacingThrows) {
    auto mask = Rect(5, 5, 1, 4, 1, 4);
    EXPECT_THROW(DistanceTransformEDT(mask, {1.0}), InvalidArgumentException);
    EXPECT_THROW(DistanceTransformEDT(mask, {1.0, 0.0}), InvalidArgumentException);
}

TEST_F(DistanceTransformTest, EmptyInput) {
    EXPECT_TRUE(DistanceTransformEDT(SeedMask()).Empty());
}

TEST_F(DistanceTransformTest, PadAndCrop) {
    auto mask = Rect(4, 5, 0, 4, 0, 5);
    auto padded = PadBinary(mask, 1);
    EXPECT_EQ(padded.Height(), 6);
    EXPECT_EQ(padded.Width(), 7);
    EXPECT_EQ(padded.At(0, 0), 0);
    EXPECT_EQ(padded.At(1, 1), 1);

    auto cropped = CropField(padded.ConvertTo<float>(), 1);
    EXPECT_TRUE(cropped.SameShape(mask));
    EXPECT_FLOAT_EQ(cropped.Min(), 1.0f);

    EXPECT_THROW(CropField(ScalarField::Create2D(2, 2), 1), InvalidArgumentException);
}

TEST_F(DistanceTransformTest, OneDimensional) {
    const double inf = std::numeric_limits<double>::infinity();
    std::vector<double> f = {0.0, inf, inf, inf, 0.0};
    DistanceTransform1D(f, 1.0);
    EXPECT_DOUBLE_EQ(f[1], 1.0);
    EXPECT_DOUBLE_EQ(f[2], 4.0);
    EXPECT_DOUBLE_EQ(f[3], 1.0);
}
