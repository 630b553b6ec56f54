/**
 * @file test_label_io.cpp
 * @brief Unit tests for IO/LabelIO.h
 */

#include <CellDeclump/IO/LabelIO.h>
#include <CellDeclump/Core/Exception.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace Cell::Declump;
using namespace Cell::Declump::IO;

namespace fs = std::filesystem;

class LabelIOTest : public ::testing::Test {
protected:
    fs::path testDir_;

    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "celldeclump_io_test";
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir_, ec);
    }

    std::string PathOf(const std::string& name) const {
        return (testDir_ / name).string();
    }

    static LabelImage MakeLabels(int32_t maxLabel) {
        auto labels = LabelImage::Create2D(6, 9);
        for (size_t i = 0; i < labels.NumVoxels(); ++i) {
            labels[i] = static_cast<int32_t>(i % 4 == 0 ? 0 : i % 7);
        }
        labels.At(5, 8) = maxLabel;
        return labels;
    }
};

// =============================================================================
// Round Trips
// =============================================================================

TEST_F(LabelIOTest, PngRoundTrip) {
    auto labels = MakeLabels(200);
    WriteLabelImage(PathOf("labels.png"), labels);

    auto loaded = ReadLabelImage(PathOf("labels.png"));
    EXPECT_TRUE(loaded == labels);
}

TEST_F(LabelIOTest, Pgm8RoundTrip) {
    auto labels = MakeLabels(12);
    WriteLabelImage(PathOf("labels.pgm"), labels);

    auto loaded = ReadLabelImage(PathOf("labels.pgm"));
    EXPECT_TRUE(loaded == labels);
}

TEST_F(LabelIOTest, Pgm16RoundTrip) {
    auto labels = MakeLabels(1000);
    WriteLabelImage(PathOf("labels.pgm"), labels);

    auto loaded = ReadLabelImage(PathOf("labels.pgm"));
    EXPECT_EQ(loaded.At(5, 8), 1000);
    EXPECT_TRUE(loaded == labels);
}

TEST_F(LabelIOTest, UppercaseExtension) {
    auto labels = MakeLabels(3);
    WriteLabelImage(PathOf("labels.PNG"), labels);
    EXPECT_TRUE(ReadLabelImage(PathOf("labels.PNG")) == labels);
}

TEST_F(LabelIOTest, StackOfSlices) {
    auto a = MakeLabels(5);
    auto b = MakeLabels(9);
    WriteLabelImage(PathOf("z0.png"), a);
    WriteLabelImage(PathOf("z1.png"), b);

    auto stack = ReadLabelStack({PathOf("z0.png"), PathOf("z1.png")});
    ASSERT_EQ(stack.NDim(), 3);
    EXPECT_EQ(stack.Depth(), 2);
    EXPECT_TRUE(stack.Slice(0) == a);
    EXPECT_TRUE(stack.Slice(1) == b);
}

TEST_F(LabelIOTest, StackSizeMismatch) {
    WriteLabelImage(PathOf("z0.png"), LabelImage::Create2D(4, 4, 1));
    WriteLabelImage(PathOf("z1.png"), LabelImage::Create2D(4, 5, 1));
    EXPECT_THROW(ReadLabelStack({PathOf("z0.png"), PathOf("z1.png")}),
                 DimensionMismatchException);
}

TEST_F(LabelIOTest, IntensityIsScaled) {
    auto labels = LabelImage::Create2D(2, 2);
    labels.At(0, 1) = 255;
    WriteLabelImage(PathOf("gray.png"), labels);

    auto intensity = ReadIntensityImage(PathOf("gray.png"));
    EXPECT_FLOAT_EQ(intensity.At(0, 0), 0.0f);
    EXPECT_FLOAT_EQ(intensity.At(0, 1), 1.0f);
}

TEST_F(LabelIOTest, SeedMaskIsBlackAndWhite) {
    auto seeds = SeedMask::Create2D(3, 3);
    seeds.At(1, 1) = 1;
    WriteSeedMask(PathOf("seeds.png"), seeds);

    auto loaded = ReadLabelImage(PathOf("seeds.png"));
    EXPECT_EQ(loaded.At(1, 1), 255);
    EXPECT_EQ(loaded.CountNonZero(), 1u);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(LabelIOTest, MissingFile) {
    EXPECT_THROW(ReadLabelImage(PathOf("missing.png")), IOException);
}

TEST_F(LabelIOTest, PngCannotHoldWideLabels) {
    EXPECT_THROW(WriteLabelImage(PathOf("wide.png"), MakeLabels(300)), UnsupportedException);
}

TEST_F(LabelIOTest, LabelsAbove16Bits) {
    EXPECT_THROW(WriteLabelImage(PathOf("huge.pgm"), MakeLabels(70000)), UnsupportedException);
}

TEST_F(LabelIOTest, VolumeCannotBeWritten) {
    EXPECT_THROW(WriteLabelImage(PathOf("volume.png"), LabelImage::Create3D(2, 3, 3)),
                 UnsupportedException);
}

TEST_F(LabelIOTest, NegativeLabels) {
    auto labels = MakeLabels(4);
    labels.At(0, 0) = -1;
    EXPECT_THROW(WriteLabelImage(PathOf("negative.png"), labels), InvalidArgumentException);
}

TEST_F(LabelIOTest, UnknownExtension) {
    EXPECT_THROW(WriteLabelImage(PathOf("labels.tif"), MakeLabels(4)), UnsupportedException);
}
