/**
 * @file test_volume.cpp
 * @brief Unit tests for Core/QVolume.h
 */

#include <gtest/gtest.h>
#include <CellDeclump/Core/QVolume.h>

using namespace Cell::Declump;

// =============================================================================
// Construction
// =============================================================================

TEST(QVolumeTest, DefaultIsEmpty) {
    LabelImage labels;
    EXPECT_TRUE(labels.Empty());
    EXPECT_EQ(labels.NumVoxels(), 0u);
    EXPECT_EQ(labels.Max(), 0);
}

TEST(QVolumeTest, Create2D) {
    auto image = ScalarField::Create2D(4, 6, 1.5f);
    EXPECT_EQ(image.NDim(), 2);
    EXPECT_EQ(image.Depth(), 1);
    EXPECT_EQ(image.Height(), 4);
    EXPECT_EQ(image.Width(), 6);
    EXPECT_EQ(image.NumVoxels(), 24u);
    EXPECT_FLOAT_EQ(image.At(3, 5), 1.5f);
}

TEST(QVolumeTest, Create3D) {
    auto stack = LabelImage::Create3D(3, 4, 5);
    EXPECT_EQ(stack.NDim(), 3);
    EXPECT_EQ(stack.NumVoxels(), 60u);
    EXPECT_EQ(stack.CountNonZero(), 0u);
}

TEST(QVolumeTest, InvalidExtentsThrow) {
    EXPECT_THROW(LabelImage::Create2D(0, 5), InvalidArgumentException);
    EXPECT_THROW(LabelImage::Create3D(2, -1, 5), InvalidArgumentException);

    Size3i bad = Size3i::Plane(3, 3);
    bad.depth = 2;
    EXPECT_THROW(LabelImage volume(bad), InvalidArgumentException);
}

TEST(QVolumeTest, LikeCopiesExtentsOnly) {
    auto labels = LabelImage::Create3D(2, 3, 4, 7);
    auto mask = SeedMask::Like(labels);
    EXPECT_TRUE(mask.SameShape(labels));
    EXPECT_EQ(mask.CountNonZero(), 0u);

    EXPECT_TRUE(SeedMask::Like(LabelImage()).Empty());
}

// =============================================================================
// Indexing
// =============================================================================

TEST(QVolumeTest, RasterIndexRoundTrip) {
    auto stack = LabelImage::Create3D(3, 4, 5);
    size_t idx = stack.Index(2, 1, 3);
    EXPECT_EQ(idx, (2u * 4 + 1) * 5 + 3);
    EXPECT_EQ(stack.Coord(idx), Point3i(2, 1, 3));
}

TEST(QVolumeTest, Contains) {
    auto image = LabelImage::Create2D(4, 5);
    EXPECT_TRUE(image.Contains({0, 3, 4}));
    EXPECT_FALSE(image.Contains({0, 4, 0}));
    EXPECT_FALSE(image.Contains({1, 0, 0}));
    EXPECT_FALSE(image.Contains({0, 0, -1}));
}

// =============================================================================
// Slices
// =============================================================================

TEST(QVolumeTest, SliceAndSetSlice) {
    auto stack = LabelImage::Create3D(3, 2, 2);
    stack.At(1, 0, 1) = 9;

    auto plane = stack.Slice(1);
    EXPECT_EQ(plane.NDim(), 2);
    EXPECT_EQ(plane.At(0, 1), 9);

    plane.Fill(4);
    stack.SetSlice(2, plane);
    EXPECT_EQ(stack.At(2, 1, 1), 4);
    EXPECT_EQ(stack.At(1, 0, 1), 9);
}

TEST(QVolumeTest, SliceOutOfRangeThrows) {
    auto stack = LabelImage::Create3D(2, 2, 2);
    EXPECT_THROW(stack.Slice(2), OutOfRangeException);
    EXPECT_THROW(stack.SetSlice(0, LabelImage::Create2D(3, 2)), DimensionMismatchException);
}

// =============================================================================
// Conversion
// =============================================================================

TEST(QVolumeTest, ForegroundMask) {
    auto labels = LabelImage::Create2D(2, 3);
    labels.At(0, 1) = 5;
    labels.At(1, 2) = 2;

    auto mask = ForegroundMask(labels);
    EXPECT_EQ(mask.CountNonZero(), 2u);
    EXPECT_EQ(mask.At(0, 1), 1);
    EXPECT_EQ(mask.At(1, 2), 1);
}

TEST(QVolumeTest, ConvertTo) {
    auto mask = SeedMask::Create2D(2, 2);
    mask.At(1, 1) = 1;
    auto field = mask.ConvertTo<float>();
    EXPECT_FLOAT_EQ(field.At(1, 1), 1.0f);
    EXPECT_FLOAT_EQ(field.Max(), 1.0f);
}
