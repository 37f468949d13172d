#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>

#include "config.hpp"

static std::string writeConfig(const std::string &name, const std::string &content)
{
    std::string filename = ::testing::TempDir() + name;
    std::ofstream file(filename);
    file << content;
    return filename;
}

TEST(KltParams, Defaults)
{
    KltParams params;

    EXPECT_EQ(params.detector_.method_, DetectionMethod::Fast);
    EXPECT_EQ(params.detector_.gridCols_, 12);
    EXPECT_EQ(params.detector_.gridRows_, 10);
    EXPECT_EQ(params.detector_.maxCorners_, 1200);
    EXPECT_EQ(params.detector_.maxLevels_, 4);
    EXPECT_EQ(params.tracker_.winSize_, 21);
    EXPECT_TRUE(params.tracker_.fbCheck_);
    EXPECT_EQ(params.maxTrackLength_, 20u);
    EXPECT_EQ(params.minTracks_, 1200u);
    EXPECT_EQ(params.maskRadius_, 9);
    EXPECT_FALSE(params.debug_);

    EXPECT_NO_THROW(params.validate());
}

TEST(KltParams, YamlOverridesPresentKeys)
{
    std::string filename = writeConfig("klt_config.yaml",
            "detector:\n"
            "  method: gftt\n"
            "  grid_cols: 8\n"
            "  max_corners: 600\n"
            "  subpixel: true\n"
            "tracker:\n"
            "  win_size: 15\n"
            "  fb_check: false\n"
            "  max_fb_distance: 2.5\n"
            "max_track_length: 5\n"
            "min_tracks: 300\n"
            "mask_radius: 12\n");

    KltParams params = KltParams::fromYaml(filename);

    EXPECT_EQ(params.detector_.method_, DetectionMethod::Gftt);
    EXPECT_EQ(params.detector_.gridCols_, 8);
    EXPECT_EQ(params.detector_.gridRows_, 10);
    EXPECT_EQ(params.detector_.maxCorners_, 600);
    EXPECT_TRUE(params.detector_.subpixel_);
    EXPECT_EQ(params.tracker_.winSize_, 15);
    EXPECT_EQ(params.tracker_.maxLevel_, 4);
    EXPECT_FALSE(params.tracker_.fbCheck_);
    EXPECT_FLOAT_EQ(params.tracker_.maxFbDistance_, 2.5f);
    EXPECT_EQ(params.maxTrackLength_, 5u);
    EXPECT_EQ(params.minTracks_, 300u);
    EXPECT_EQ(params.maskRadius_, 12);

    std::remove(filename.c_str());
}

TEST(KltParams, InvalidConfigsThrow)
{
    std::string method = writeConfig("klt_method.yaml", "detector:\n  method: orb\n");
    EXPECT_THROW(KltParams::fromYaml(method), std::runtime_error);

    std::string type = writeConfig("klt_type.yaml", "tracker:\n  win_size: large\n");
    EXPECT_THROW(KltParams::fromYaml(type), std::runtime_error);

    std::string length = writeConfig("klt_length.yaml", "max_track_length: 0\n");
    EXPECT_THROW(KltParams::fromYaml(length), std::runtime_error);

    EXPECT_THROW(KltParams::fromYaml(::testing::TempDir() + "klt_missing.yaml"), std::runtime_error);

    std::remove(method.c_str());
    std::remove(type.c_str());
    std::remove(length.c_str());
}

TEST(KltParams, DetectionMethodNames)
{
    EXPECT_EQ(detectionMethodFromString("fast"), DetectionMethod::Fast);
    EXPECT_EQ(detectionMethodFromString("gftt"), DetectionMethod::Gftt);
    EXPECT_EQ(detectionMethodToString(DetectionMethod::Gftt), "gftt");
    EXPECT_THROW(detectionMethodFromString("sift"), std::runtime_error);
}

TEST(KltParams, PrintUsesTheKltPrefix)
{
    std::ostringstream os;
    KltParams().print(os);

    EXPECT_EQ(os.str().rfind("- [KLT]: Configure", 0), 0u);
}
