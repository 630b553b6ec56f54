/**
 * @file test_declump.cpp
 * @brief Unit tests for Segment/Declump.h
 */

#include <gtest/gtest.h>
#include <CellDeclump/Segment/Declump.h>
#include <CellDeclump/Core/Exception.h>

#include <set>

using namespace Cell::Declump;
using namespace Cell::Declump::Segment;

namespace {

// Two 7x7 squares joined by a one pixel wide neck on row 5
LabelImage MakeDumbbell() {
    auto labels = LabelImage::Create2D(11, 21);
    for (int32_t y = 2; y <= 8; ++y) {
        for (int32_t x = 2; x <= 8; ++x) labels.At(y, x) = 1;
        for (int32_t x = 12; x <= 18; ++x) labels.At(y, x) = 1;
    }
    for (int32_t x = 9; x <= 11; ++x) labels.At(5, x) = 1;
    return labels;
}

// Label shared by every voxel of a rectangle, or -1 if it is not uniform
int32_t UniformLabel(const LabelImage& labels, int32_t y0, int32_t y1, int32_t x0, int32_t x1) {
    int32_t value = labels.At(y0, x0);
    for (int32_t y = y0; y <= y1; ++y) {
        for (int32_t x = x0; x <= x1; ++x) {
            if (labels.At(y, x) != value) return -1;
        }
    }
    return value;
}

std::set<int32_t> DistinctLabels(const LabelImage& labels) {
    return std::set<int32_t>(labels.Values().begin(), labels.Values().end());
}

DeclumpParams DumbbellParams() {
    DeclumpParams params;
    params.sigma = 0.0;
    params.finder = SeedFinderParams::Relative(0.5, 1);
    return params;
}

} // anonymous namespace

// =============================================================================
// Basins
// =============================================================================

TEST(DeclumpBasinTest, ShapeBasinInvertsDistance) {
    auto distance = ScalarField::Create2D(2, 2);
    distance.At(0, 1) = 1.0f;
    distance.At(1, 0) = 2.0f;
    distance.At(1, 1) = 3.0f;

    auto basin = ShapeBasin(distance);
    EXPECT_FLOAT_EQ(basin.At(0, 0), 3.0f);
    EXPECT_FLOAT_EQ(basin.At(0, 1), 2.0f);
    EXPECT_FLOAT_EQ(basin.At(1, 0), 1.0f);
    EXPECT_FLOAT_EQ(basin.At(1, 1), 0.0f);
}

TEST(DeclumpBasinTest, IntensityBasinNormalizes) {
    auto reference = ScalarField::Create2D(1, 3);
    reference.At(0, 0) = 2.0f;
    reference.At(0, 1) = 4.0f;
    reference.At(0, 2) = 6.0f;

    auto basin = IntensityBasin(reference);
    EXPECT_FLOAT_EQ(basin.At(0, 0), 1.0f);
    EXPECT_FLOAT_EQ(basin.At(0, 1), 0.5f);
    EXPECT_FLOAT_EQ(basin.At(0, 2), 0.0f);
}

TEST(DeclumpBasinTest, ConstantReferenceGivesFlatBasin) {
    auto reference = ScalarField::Create2D(3, 3, 0.7f);
    auto basin = IntensityBasin(reference);
    for (size_t i = 0; i < basin.NumVoxels(); ++i) {
        EXPECT_FLOAT_EQ(basin[i], 1.0f);
    }
}

// =============================================================================
// WatershedDeclump
// =============================================================================

TEST(WatershedDeclumpTest, SplitsAtDimSeam) {
    auto labels = LabelImage::Create2D(11, 21);
    auto reference = ScalarField::Create2D(11, 21, 1.0f);
    for (int32_t y = 2; y <= 8; ++y) {
        for (int32_t x = 2; x <= 18; ++x) labels.At(y, x) = 1;
        reference.At(y, 10) = 0.0f;
    }
    auto seeds = SeedMask::Like(labels);
    seeds.At(5, 4) = 1;
    seeds.At(5, 16) = 1;

    auto result = WatershedDeclump(labels, seeds, StructElement::Disk(1),
                                   IntensityBasin(reference));

    int32_t left = UniformLabel(result, 2, 8, 2, 9);
    int32_t right = UniformLabel(result, 2, 8, 11, 18);
    EXPECT_GT(left, 0);
    EXPECT_GT(right, 0);
    EXPECT_NE(left, right);
    EXPECT_EQ(result.Max(), 2);
    EXPECT_EQ(result.At(0, 0), 0);
}

TEST(WatershedDeclumpTest, UnseededObjectsBecomeBackground) {
    // Three separate 5x5 squares, only the first one seeded
    auto labels = LabelImage::Create2D(10, 30);
    for (int32_t y = 2; y <= 6; ++y) {
        for (int32_t x = 2; x <= 6; ++x) labels.At(y, x) = 1;
        for (int32_t x = 12; x <= 16; ++x) labels.At(y, x) = 2;
        for (int32_t x = 22; x <= 26; ++x) labels.At(y, x) = 3;
    }
    auto seeds = SeedMask::Like(labels);
    seeds.At(4, 4) = 1;

    auto result = WatershedDeclump(labels, seeds, StructElement::Disk(1),
                                   ScalarField::Like(labels));

    EXPECT_EQ(UniformLabel(result, 2, 6, 2, 6), 1);
    EXPECT_EQ(UniformLabel(result, 2, 6, 12, 16), 0);
    EXPECT_EQ(UniformLabel(result, 2, 6, 22, 26), 0);
    EXPECT_EQ(DistinctLabels(result), (std::set<int32_t>{0, 1}));
}

TEST(WatershedDeclumpTest, EachSeededObjectKeepsItsOwnLabel) {
    auto labels = LabelImage::Create2D(10, 30);
    for (int32_t y = 2; y <= 6; ++y) {
        for (int32_t x = 2; x <= 6; ++x) labels.At(y, x) = 1;
        for (int32_t x = 12; x <= 16; ++x) labels.At(y, x) = 2;
        for (int32_t x = 22; x <= 26; ++x) labels.At(y, x) = 3;
    }
    auto seeds = SeedMask::Like(labels);
    seeds.At(4, 14) = 1;
    seeds.At(4, 24) = 1;

    auto result = WatershedDeclump(labels, seeds, StructElement::Disk(0),
                                   ScalarField::Like(labels));

    int32_t middle = UniformLabel(result, 2, 6, 12, 16);
    int32_t right = UniformLabel(result, 2, 6, 22, 26);
    EXPECT_GT(middle, 0);
    EXPECT_GT(right, 0);
    EXPECT_NE(middle, right);
    EXPECT_EQ(UniformLabel(result, 2, 6, 2, 6), 0);
    EXPECT_EQ(result.Max(), 2);
}

TEST(WatershedDeclumpTest, ShapeMismatchThrows) {
    auto labels = LabelImage::Create2D(5, 5, 1);
    auto seeds = SeedMask::Create2D(5, 6);
    EXPECT_THROW(WatershedDeclump(labels, seeds, StructElement::Disk(1),
                                  ScalarField::Like(labels)),
                 DimensionMismatchException);
}

// =============================================================================
// DeclumpObjects
// =============================================================================

TEST(DeclumpObjectsTest, SplitsDumbbell) {
    auto labels = MakeDumbbell();
    auto result = DeclumpObjects(labels, DumbbellParams());

    int32_t left = UniformLabel(result, 2, 8, 2, 8);
    int32_t right = UniformLabel(result, 2, 8, 12, 18);
    EXPECT_GT(left, 0);
    EXPECT_GT(right, 0);
    EXPECT_NE(left, right);
    EXPECT_EQ(result.Max(), 2);
}

TEST(DeclumpObjectsTest, PreservesBackground) {
    auto labels = MakeDumbbell();
    auto result = DeclumpObjects(labels, DumbbellParams());
    for (size_t i = 0; i < labels.NumVoxels(); ++i) {
        EXPECT_EQ(labels[i] == 0, result[i] == 0) << "voxel " << i;
    }
}

TEST(DeclumpObjectsTest, LabelsAreContiguous) {
    auto labels = MakeDumbbell();
    auto result = DeclumpObjects(labels, DumbbellParams());
    EXPECT_EQ(DistinctLabels(result), (std::set<int32_t>{0, 1, 2}));
}

TEST(DeclumpObjectsTest, Deterministic) {
    auto labels = MakeDumbbell();
    auto first = DeclumpObjects(labels, DeclumpParams::Shape(1.0));
    auto second = DeclumpObjects(labels, DeclumpParams::Shape(1.0));
    EXPECT_TRUE(first == second);
}

TEST(DeclumpObjectsTest, NoSeedsGivesEmptyLabeling) {
    auto labels = MakeDumbbell();
    DeclumpParams params = DumbbellParams();
    params.finder = SeedFinderParams::Absolute(100.0);

    auto result = DeclumpObjects(labels, params);
    ASSERT_TRUE(result.SameShape(labels));
    EXPECT_EQ(result.CountNonZero(), 0u);
}

TEST(DeclumpObjectsTest, AllBackground) {
    auto labels = LabelImage::Create2D(8, 8);
    auto result = DeclumpObjects(labels);
    EXPECT_EQ(result.CountNonZero(), 0u);
}

TEST(DeclumpObjectsTest, IntensityMethodFollowsDimNeck) {
    auto labels = MakeDumbbell();
    auto reference = ScalarField::Like(labels);
    for (size_t i = 0; i < labels.NumVoxels(); ++i) {
        if (labels[i] != 0) reference[i] = 1.0f;
    }
    for (int32_t x = 9; x <= 11; ++x) reference.At(5, x) = 0.2f;

    DeclumpParams params = DumbbellParams();
    params.method = DeclumpMethod::Intensity;
    auto result = DeclumpObjects(labels, params, reference);

    int32_t left = UniformLabel(result, 2, 8, 2, 8);
    int32_t right = UniformLabel(result, 2, 8, 12, 18);
    EXPECT_GT(left, 0);
    EXPECT_GT(right, 0);
    EXPECT_NE(left, right);
    EXPECT_EQ(result.Max(), 2);
}

TEST(DeclumpObjectsTest, VolumetricDumbbell) {
    auto labels = LabelImage::Create3D(11, 11, 21);
    for (int32_t z = 2; z <= 8; ++z) {
        for (int32_t y = 2; y <= 8; ++y) {
            for (int32_t x = 2; x <= 8; ++x) labels.At(z, y, x) = 1;
            for (int32_t x = 12; x <= 18; ++x) labels.At(z, y, x) = 1;
        }
    }
    for (int32_t x = 9; x <= 11; ++x) labels.At(5, 5, x) = 1;

    DeclumpParams params = DeclumpParams::Volumetric();
    params.sigma = 0.0;
    params.finder = SeedFinderParams::Relative(0.5, 1);
    auto result = DeclumpObjects(labels, params);

    int32_t left = result.At(5, 5, 5);
    int32_t right = result.At(5, 5, 15);
    EXPECT_GT(left, 0);
    EXPECT_GT(right, 0);
    EXPECT_NE(left, right);
    EXPECT_EQ(result.At(2, 2, 2), left);
    EXPECT_EQ(result.At(8, 8, 18), right);
    EXPECT_EQ(result.Max(), 2);
}

// =============================================================================
// Validation
// =============================================================================

TEST(DeclumpObjectsTest, StructElementDimensionMismatch) {
    auto labels = LabelImage::Create3D(4, 6, 6, 1);
    EXPECT_THROW(DeclumpObjects(labels, DeclumpParams::Default()), DimensionMismatchException);
}

TEST(DeclumpObjectsTest, InvalidConnectivity) {
    auto labels = MakeDumbbell();
    DeclumpParams params;
    params.connectivity = 0;
    EXPECT_THROW(DeclumpObjects(labels, params), InvalidArgumentException);
    params.connectivity = 3;
    EXPECT_THROW(DeclumpObjects(labels, params), InvalidArgumentException);
}

TEST(DeclumpObjectsTest, NegativeSigma) {
    auto labels = MakeDumbbell();
    EXPECT_THROW(DeclumpObjects(labels, DeclumpParams::Shape(-1.0)), InvalidArgumentException);
}

TEST(DeclumpObjectsTest, IntensityRequiresReference) {
    auto labels = MakeDumbbell();
    EXPECT_THROW(DeclumpObjects(labels, DeclumpParams::Intensity()), InvalidArgumentException);
}

TEST(DeclumpObjectsTest, IntensityReferenceShapeMismatch) {
    auto labels = MakeDumbbell();
    auto reference = ScalarField::Create2D(11, 20, 1.0f);
    EXPECT_THROW(DeclumpObjects(labels, DeclumpParams::Intensity(), reference),
                 DimensionMismatchException);
}
