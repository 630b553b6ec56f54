/**
 * @file test_morph_binary.cpp
 * @brief Unit tests for Internal/MorphBinary.h
 */

#include <gtest/gtest.h>
#include <CellDeclump/Internal/MorphBinary.h>

using namespace Cell::Declump;
using namespace Cell::Declump::Internal;

// =============================================================================
// Dilation
// =============================================================================

TEST(MorphBinaryTest, DilateSinglePixelWithDisk) {
    auto mask = SeedMask::Create2D(7, 7);
    mask.At(3, 3) = 1;

    auto dilated = Dilate(mask, StructElement::Disk(2));
    EXPECT_EQ(dilated.CountNonZero(), 13u);
    EXPECT_EQ(dilated.At(1, 3), 1);
    EXPECT_EQ(dilated.At(1, 1), 0);
}

TEST(MorphBinaryTest, DilateClipsAtEdge) {
    auto mask = SeedMask::Create2D(4, 4);
    mask.At(0, 0) = 1;
    auto dilated = Dilate(mask, StructElement::Square(3));
    EXPECT_EQ(dilated.CountNonZero(), 4u);
}

TEST(MorphBinaryTest, DilateVolume) {
    auto mask = SeedMask::Create3D(3, 3, 3);
    mask.At(1, 1, 1) = 1;
    auto dilated = Dilate(mask, StructElement::Ball(1));
    EXPECT_EQ(dilated.CountNonZero(), 7u);
    EXPECT_EQ(dilated.At(0, 1, 1), 1);
}

TEST(MorphBinaryTest, DilateDimensionMismatchThrows) {
    auto planar = SeedMask::Create2D(5, 5);
    auto stack = SeedMask::Create3D(3, 5, 5);
    EXPECT_THROW(Dilate(planar, StructElement::Ball(1)), DimensionMismatchException);
    EXPECT_THROW(Dilate(stack, StructElement::Disk(1)), DimensionMismatchException);
    EXPECT_THROW(Dilate(planar, StructElement()), InvalidArgumentException);
}

// =============================================================================
// Boundaries
// =============================================================================

class FindBoundariesTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Two touching 2x2 objects in a 4x6 image
        labels_ = LabelImage::Create2D(4, 6);
        for (int32_t y = 1; y < 3; ++y) {
            labels_.At(y, 1) = 1;
            labels_.At(y, 2) = 1;
            labels_.At(y, 3) = 2;
            labels_.At(y, 4) = 2;
        }
    }

    LabelImage labels_;
};

TEST_F(FindBoundariesTest, InnerMarksEveryObjectVoxelTouchingOtherValue) {
    auto inner = FindBoundaries(labels_, BoundaryMode::Inner);
    // 2x2 objects: every voxel touches background or the other object
    EXPECT_EQ(inner.CountNonZero(), 8u);
    EXPECT_EQ(inner.At(0, 1), 0);
}

TEST_F(FindBoundariesTest, InnerIgnoresImageEdge) {
    auto labels = LabelImage::Create2D(3, 3, 1);
    auto inner = FindBoundaries(labels, BoundaryMode::Inner);
    EXPECT_EQ(inner.CountNonZero(), 0u);
}

TEST_F(FindBoundariesTest, OuterMarksBackgroundRingAndContact) {
    auto outer = FindBoundaries(labels_, BoundaryMode::Outer);
    // Face-connected background ring around the pair
    EXPECT_EQ(outer.At(0, 1), 1);
    EXPECT_EQ(outer.At(1, 0), 1);
    EXPECT_EQ(outer.At(1, 5), 1);
    EXPECT_EQ(outer.At(0, 0), 0);
    // Object voxels on the 1|2 contact
    EXPECT_EQ(outer.At(1, 2), 1);
    EXPECT_EQ(outer.At(1, 3), 1);
    // Object voxel touching only background
    EXPECT_EQ(outer.At(1, 1), 0);
}

TEST_F(FindBoundariesTest, InvalidConnectivityThrows) {
    EXPECT_THROW(FindBoundaries(labels_, BoundaryMode::Inner, 3), InvalidArgumentException);
}
