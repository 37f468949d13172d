#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <opencv2/imgcodecs.hpp>

#include "kitti_dataset.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

class DatasetTest : public ::testing::Test
{

protected:
    void SetUp() override
    {
        root_ = fs::temp_directory_path() / (std::string("kitti_klt_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override
    {
        fs::remove_all(root_);
    }

    static void writeImage(const fs::path &filename, int value, int cols = 64, int rows = 48)
    {
        fs::create_directories(filename.parent_path());
        cv::imwrite(filename.string(), cv::Mat(rows, cols, CV_8UC1, cv::Scalar(value)));
    }

    static void writeScan(const fs::path &filename, int numPoints)
    {
        fs::create_directories(filename.parent_path());

        std::ofstream file(filename, std::ios::binary);
        for (int i = 0; i < numPoints; i++)
        {
            float record[4] = {static_cast<float>(i), 2.f * i, -1.f, 0.5f};
            file.write(reinterpret_cast<const char *>(record), sizeof(record));
        }
    }

    static void writeText(const fs::path &filename, const std::string &content)
    {
        fs::create_directories(filename.parent_path());

        std::ofstream file(filename);
        file << content;
    }

    // KITTI odometry layout with numFrames stereo pairs
    void makeOdometrySequence(const std::string &sequence, int numFrames)
    {
        fs::path seq = root_ / "sequences" / sequence;

        for (int i = 0; i < numFrames; i++)
        {
            writeImage(seq / "image_0" / Utils::formatTemplate("%06i.png", i), 10 * i);
            writeImage(seq / "image_1" / Utils::formatTemplate("%06i.png", i), 10 * i + 1);
        }
    }

    fs::path root_;
};

TEST_F(DatasetTest, ImageReaderStopsAtTheFirstGap)
{
    writeImage(root_ / "img" / "000000.png", 1);
    writeImage(root_ / "img" / "000001.png", 2);
    writeImage(root_ / "img" / "000003.png", 3);

    ImageDatasetReader reader((root_ / "img" / "%06i.png").string());

    EXPECT_EQ(reader.length(), 2u);

    cv::Mat image;
    ASSERT_TRUE(reader.next(image));
    EXPECT_EQ(image.at<uchar>(0, 0), 1);
    ASSERT_TRUE(reader.next(image));
    EXPECT_EQ(image.at<uchar>(0, 0), 2);
    EXPECT_FALSE(reader.next(image));

    reader.reset();
    ASSERT_TRUE(reader.next(image));
    EXPECT_EQ(image.at<uchar>(0, 0), 1);

    ImageDatasetReader offset((root_ / "img" / "%06i.png").string(), 1, 1);
    EXPECT_EQ(offset.length(), 1u);

    ImageDatasetReader missing((root_ / "nothing" / "%06i.png").string());
    EXPECT_TRUE(missing.empty());
}

TEST_F(DatasetTest, ImageReaderHandlesIndexRangesUpToIntMax)
{
    writeImage(root_ / "img" / "000000.png", 1);
    writeImage(root_ / "img" / "000001.png", 2);

    const std::string pattern = (root_ / "img" / "%06i.png").string();
    const int maxInt = std::numeric_limits<int>::max();

    ImageDatasetReader all(pattern, 0, maxInt);
    EXPECT_EQ(all.length(), 2u);

    ImageDatasetReader tail(pattern, maxInt - 1, 10);
    EXPECT_TRUE(tail.empty());

    EXPECT_THROW(ImageDatasetReader((root_ / "img" / "%s.png").string()), std::runtime_error);
}

TEST_F(DatasetTest, ImageReaderScalesImages)
{
    writeImage(root_ / "img" / "000000.png", 5, 64, 48);

    ImageDatasetReader reader((root_ / "img" / "%06i.png").string(), 0, 50000, 0.5);

    cv::Mat image = reader.read(0);
    EXPECT_EQ(image.size(), cv::Size(32, 24));
}

TEST_F(DatasetTest, VelodyneScansAreFloatRecords)
{
    writeScan(root_ / "velodyne" / "000000.bin", 5);
    writeText(root_ / "bad.bin", "abc");

    VelodyneDatasetReader reader((root_ / "velodyne" / "%06i.bin").string());
    ASSERT_EQ(reader.length(), 1u);

    cv::Mat cloud = reader.read(0);
    ASSERT_EQ(cloud.rows, 5);
    ASSERT_EQ(cloud.cols, 4);
    ASSERT_EQ(cloud.type(), CV_32F);
    EXPECT_FLOAT_EQ(cloud.at<float>(3, 0), 3.f);
    EXPECT_FLOAT_EQ(cloud.at<float>(3, 1), 6.f);
    EXPECT_FLOAT_EQ(cloud.at<float>(3, 3), 0.5f);

    EXPECT_THROW(VelodyneDatasetReader::readScan((root_ / "bad.bin").string()), std::runtime_error);
}

TEST_F(DatasetTest, OdometryWithoutPosesOrVelodyne)
{
    makeOdometrySequence("00", 3);

    KITTIDatasetReader reader(root_.string(), "00");

    EXPECT_EQ(reader.length(), 3u);
    EXPECT_FALSE(reader.hasPoses());
    EXPECT_FALSE(reader.hasVelodyne());
    ASSERT_TRUE(reader.calib().has_value());
    EXPECT_EQ(*reader.calib(), KittiCalibration::kitti_00_02);

    KittiFrame frame;
    size_t count = 0;

    while (reader.nextFrame(frame))
    {
        EXPECT_EQ(frame.index, count);
        EXPECT_EQ(frame.left.at<uchar>(0, 0), 10 * count);
        EXPECT_EQ(frame.right.at<uchar>(0, 0), 10 * count + 1);
        EXPECT_FALSE(frame.pose.has_value());
        EXPECT_FALSE(frame.velodyne.has_value());
        count++;
    }

    EXPECT_EQ(count, 3u);

    cv::Mat cloud;
    EXPECT_FALSE(reader.nextVelodyneFrame(cloud));

    reader.reset();
    ASSERT_TRUE(reader.nextStereoVelodyneFrame(frame));
    EXPECT_EQ(frame.index, 0u);
    EXPECT_FALSE(frame.velodyne.has_value());
}

TEST_F(DatasetTest, OdometryWithPosesAndVelodyne)
{
    makeOdometrySequence("04", 2);
    writeText(root_ / "poses" / "04.txt",
              "1 0 0 0 0 1 0 0 0 0 1 0\n"
              "1 0 0 0 0 1 0 0 0 0 1 1.5\n");
    writeScan(root_ / "sequences" / "04" / "velodyne" / "000000.bin", 3);
    writeScan(root_ / "sequences" / "04" / "velodyne" / "000001.bin", 4);

    KITTIDatasetReader reader(root_.string(), "04", "image_0/%06i.png", "image_1/%06i.png", "velodyne/%06i.bin", 0, 50000, 0.5);

    EXPECT_TRUE(reader.hasPoses());
    EXPECT_TRUE(reader.hasVelodyne());
    EXPECT_EQ(*reader.calib(), KittiCalibration::kitti_04_12.scaled(0.5));

    KittiFrame frame;

    ASSERT_TRUE(reader.nextStereoVelodyneFrame(frame));
    EXPECT_EQ(frame.left.size(), cv::Size(32, 24));
    ASSERT_TRUE(frame.pose.has_value());
    EXPECT_TRUE(frame.pose->translation().isZero());
    ASSERT_TRUE(frame.velodyne.has_value());
    EXPECT_EQ(frame.velodyne->rows, 3);

    ASSERT_TRUE(reader.nextStereoVelodyneFrame(frame));
    EXPECT_DOUBLE_EQ(frame.pose->translation().z(), 1.5);
    EXPECT_EQ(frame.velodyne->rows, 4);

    EXPECT_FALSE(reader.nextStereoVelodyneFrame(frame));
}

TEST_F(DatasetTest, ShortPoseFileEndsBeforeTheImages)
{
    makeOdometrySequence("01", 2);
    writeText(root_ / "poses" / "01.txt", "1 0 0 0 0 1 0 0 0 0 1 0\n");

    KITTIDatasetReader reader(root_.string(), "01");
    KittiFrame frame;

    ASSERT_TRUE(reader.nextFrame(frame));
    EXPECT_TRUE(frame.pose.has_value());

    ASSERT_TRUE(reader.nextFrame(frame));
    EXPECT_FALSE(frame.pose.has_value());

    EXPECT_FALSE(reader.nextFrame(frame));
}

TEST_F(DatasetTest, MalformedPoseFileMeansNoPoses)
{
    makeOdometrySequence("02", 2);
    writeText(root_ / "poses" / "02.txt", "1 0 0\n");

    std::unique_ptr<KITTIDatasetReader> reader;
    ASSERT_NO_THROW(reader = std::make_unique<KITTIDatasetReader>(root_.string(), "02"));

    EXPECT_FALSE(reader->hasPoses());
    EXPECT_EQ(reader->length(), 2u);

    KittiFrame frame;
    ASSERT_TRUE(reader->nextFrame(frame));
    EXPECT_FALSE(frame.pose.has_value());
}

TEST_F(DatasetTest, UnknownSequenceIsFatal)
{
    makeOdometrySequence("13", 1);

    EXPECT_THROW(KITTIDatasetReader(root_.string(), "13"), std::runtime_error);
}

TEST_F(DatasetTest, ScenesCreateOneReaderPerSequence)
{
    makeOdometrySequence("00", 2);
    makeOdometrySequence("03", 1);

    auto readers = KITTIDatasetReader::scenes({"00", "03"}, root_.string());

    ASSERT_EQ(readers.size(), 2u);
    EXPECT_EQ(readers[0]->sequence(), "00");
    EXPECT_EQ(readers[0]->length(), 2u);
    EXPECT_EQ(readers[1]->length(), 1u);
    EXPECT_EQ(*readers[1]->calib(), KittiCalibration::kitti_03);
}

TEST_F(DatasetTest, RawDriveWithOxts)
{
    for (int i = 0; i < 2; i++)
    {
        writeImage(root_ / "image_00" / "data" / Utils::formatTemplate("%010i.png", i), i);
        writeImage(root_ / "image_01" / "data" / Utils::formatTemplate("%010i.png", i), i);
        writeText(root_ / "oxts" / "data" / Utils::formatTemplate("%010i.txt", i),
                  std::to_string(49.0 + i) + " 8.5 " + std::to_string(100 * i) + "\n");
    }

    writeText(root_ / "oxts" / "dataformat.txt",
              "lat:   latitude of the oxts-unit (deg)\n"
              "lon:   longitude of the oxts-unit (deg)\n"
              "alt:   altitude of the oxts-unit (m)\n");

    KITTIRawDatasetReader reader(root_.string());

    EXPECT_FALSE(reader.calib().has_value());
    EXPECT_FALSE(reader.hasPoses());
    EXPECT_FALSE(reader.hasVelodyne());
    ASSERT_TRUE(reader.hasOxts());
    EXPECT_EQ(reader.oxtFieldNames(), (std::vector<std::string>{"lat", "lon", "alt"}));

    KittiRawFrame frame;

    ASSERT_TRUE(reader.nextFrame(frame));
    ASSERT_TRUE(frame.oxts.has_value());
    EXPECT_DOUBLE_EQ(*frame.oxts->get("lat"), 49.0);
    EXPECT_DOUBLE_EQ(*frame.oxts->get("lon"), 8.5);
    EXPECT_FALSE(frame.oxts->get("vf").has_value());

    ASSERT_TRUE(reader.nextFrame(frame));
    EXPECT_DOUBLE_EQ(*frame.oxts->get("alt"), 100.0);

    EXPECT_FALSE(reader.nextFrame(frame));

    reader.reset();

    OxtsRecord record;
    ASSERT_TRUE(reader.nextOxts(record));
    EXPECT_DOUBLE_EQ(*record.get("lat"), 49.0);
}

TEST_F(DatasetTest, RawDriveWithoutOxts)
{
    writeImage(root_ / "image_00" / "data" / "0000000000.png", 1);
    writeImage(root_ / "image_01" / "data" / "0000000000.png", 1);

    KITTIRawDatasetReader reader(root_.string());

    EXPECT_FALSE(reader.hasOxts());

    KittiRawFrame frame;
    ASSERT_TRUE(reader.nextFrame(frame));
    EXPECT_FALSE(frame.oxts.has_value());

    OxtsRecord record;
    EXPECT_FALSE(reader.nextOxts(record));
}

TEST_F(DatasetTest, StereoGroundTruth)
{
    writeImage(root_ / "image_0" / "000000_10.png", 20);
    writeImage(root_ / "image_1" / "000000_10.png", 30);

    fs::create_directories(root_ / "disp_occ");
    cv::imwrite((root_ / "disp_occ" / "000000_10.png").string(), cv::Mat(48, 64, CV_16UC1, cv::Scalar(256 * 10)));

    writeText(root_ / "calib" / "000000.txt",
              "P0: 700 0 600 0 0 700 180 0 0 0 1 0\n"
              "P1: 700 0 600 -378 0 700 180 0 0 0 1 0\n");

    KITTIStereoGroundTruthDatasetReader reader(root_.string());
    EXPECT_EQ(reader.length(), 1u);

    StereoGroundTruthFrame frame;
    ASSERT_TRUE(reader.nextGroundTruthFrame(frame));

    EXPECT_EQ(frame.left.type(), CV_8UC1);
    EXPECT_EQ(frame.left.at<uchar>(0, 0), 20);

    ASSERT_EQ(frame.occ.type(), CV_32F);
    EXPECT_FLOAT_EQ(frame.occ.at<float>(5, 5), 10.f);
    EXPECT_FLOAT_EQ(frame.depth.at<float>(5, 5), 10.f);
    EXPECT_TRUE(frame.noc.empty());

    ASSERT_TRUE(frame.calib.has_value());
    EXPECT_DOUBLE_EQ(frame.calib->fx(), 700.);
    EXPECT_DOUBLE_EQ(frame.calib->baselinePx(), 378.);

    EXPECT_FALSE(reader.nextGroundTruthFrame(frame));

    reader.reset();
    KittiFrame plain;
    ASSERT_TRUE(reader.nextFrame(plain));
    EXPECT_FALSE(plain.pose.has_value());
}

TEST_F(DatasetTest, OmnicamStereoAndVelodyne)
{
    fs::path drive = root_ / "2013_05_14_drive_0008_sync";

    for (int i = 0; i < 2; i++)
    {
        writeImage(drive / "image_02" / "data" / Utils::formatTemplate("%010i.png", i), i);
        writeImage(drive / "image_03" / "data" / Utils::formatTemplate("%010i.png", i), i);
    }

    writeScan(drive / "velodyne_points" / "data" / "0000000000.bin", 2);

    OmnicamDatasetReader reader(root_.string());

    EXPECT_EQ(reader.length(), 2u);
    EXPECT_TRUE(reader.hasVelodyne());

    KittiFrame frame;
    ASSERT_TRUE(reader.nextStereoVelodyneFrame(frame));
    ASSERT_TRUE(frame.velodyne.has_value());
    EXPECT_EQ(frame.velodyne->rows, 2);

    ASSERT_TRUE(reader.nextStereoVelodyneFrame(frame));
    EXPECT_FALSE(frame.velodyne.has_value());

    EXPECT_FALSE(reader.nextStereoVelodyneFrame(frame));
}

TEST_F(DatasetTest, StereoLengthIsTheShorterSide)
{
    writeImage(root_ / "l" / "000000.png", 1);
    writeImage(root_ / "l" / "000001.png", 1);
    writeImage(root_ / "r" / "000000.png", 1);

    StereoDatasetReader reader(root_.string(), "l/%06i.png", "r/%06i.png");

    EXPECT_EQ(reader.length(), 1u);

    StereoFrame frame;
    EXPECT_TRUE(reader.next(frame));
    EXPECT_FALSE(reader.next(frame));
}
