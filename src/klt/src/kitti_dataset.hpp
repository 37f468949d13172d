#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "dataset_readers.hpp"
#include "frame_records.hpp"
#include "stereo_calibration.hpp"

/*
   KITTI odometry layout                    KITTI raw layout
   ----------------------------------------------------------------------------
   <dir>/sequences/<seq>/image_0/%06i.png   <drive>/image_00/data/%010i.png
   <dir>/sequences/<seq>/image_1/%06i.png   <drive>/image_01/data/%010i.png
   <dir>/sequences/<seq>/velodyne/%06i.bin  <drive>/velodyne_points/data/%010i.bin
   <dir>/poses/<seq>.txt                    <drive>/oxts/data/%010i.txt
   ----------------------------------------------------------------------------

   Every stream shares the per-modality cursors of its reader, reset() restarts
   all of them. Absent modalities (poses, velodyne, OXTS) yield std::nullopt.
*/

// Stereo images + poses + velodyne + calibration of a KITTI odometry sequence
// http://www.cvlibs.net/datasets/kitti/setup.php
class KITTIDatasetReader
{

public:
    KITTIDatasetReader(const std::string &directory,
                       const std::string &sequence,
                       const std::string &leftTemplate = "image_0/%06i.png",
                       const std::string &rightTemplate = "image_1/%06i.png",
                       const std::string &velodyneTemplate = "velodyne/%06i.bin",
                       int startIdx = 0, int maxFiles = 50000, double scale = 1.0);

    virtual ~KITTIDatasetReader() = default;

    // Stereo pair and pose
    bool nextFrame(KittiFrame &frame);

    bool nextStereoFrame(StereoFrame &frame);

    bool nextVelodyneFrame(cv::Mat &cloud);

    // Stereo pair, pose and velodyne scan
    bool nextStereoVelodyneFrame(KittiFrame &frame);

    virtual void reset();

    // One reader per sequence
    static std::vector<std::shared_ptr<KITTIDatasetReader>> scenes(
            const std::vector<std::string> &sequences,
            const std::string &directory,
            const std::string &leftTemplate = "image_0/%06i.png",
            const std::string &rightTemplate = "image_1/%06i.png",
            const std::string &velodyneTemplate = "velodyne/%06i.bin",
            int startIdx = 0, int maxFiles = 50000, double scale = 1.0);

    const std::optional<StereoCalibration> &calib() const
    {
        return calib_;
    }

    const std::string &sequence() const
    {
        return sequence_;
    }

    double scale() const
    {
        return scale_;
    }

    size_t length() const
    {
        return stereo_->length();
    }

    const StereoDatasetReader &stereo() const
    {
        return *stereo_;
    }

    bool hasPoses() const
    {
        return poses_ != nullptr;
    }

    bool hasVelodyne() const
    {
        return velodyne_ != nullptr;
    }

    const PoseFileReader *poses() const
    {
        return poses_.get();
    }

protected:
    // Members only, used by readers with a different directory layout
    KITTIDatasetReader(const std::string &directory, const std::string &sequence, double scale);

    void openPoses(const std::string &filename);

    void openVelodyne(const std::string &pattern, int startIdx, int maxFiles);

    std::optional<Sophus::SE3d> nextPose();

    std::optional<cv::Mat> nextVelodyne();

    std::string directory_;
    std::string sequence_;
    double scale_;

    std::optional<StereoCalibration> calib_;

    std::unique_ptr<StereoDatasetReader> stereo_;
    std::unique_ptr<PoseFileReader> poses_;
    std::unique_ptr<VelodyneDatasetReader> velodyne_;
};

// KITTIDatasetReader over a raw drive directory, with OXTS records
class KITTIRawDatasetReader : public KITTIDatasetReader
{

public:
    // The calibration table is only looked up when sequence is not empty
    KITTIRawDatasetReader(const std::string &directory,
                          const std::string &sequence = "",
                          const std::string &leftTemplate = "image_00/data/%010i.png",
                          const std::string &rightTemplate = "image_01/data/%010i.png",
                          const std::string &velodyneTemplate = "velodyne_points/data/%010i.bin",
                          const std::string &oxtTemplate = "oxts/data/%010i.txt",
                          int startIdx = 0, int maxFiles = 50000, double scale = 1.0);

    using KITTIDatasetReader::nextFrame;

    // Stereo pair, pose and OXTS record
    bool nextFrame(KittiRawFrame &frame);

    bool nextOxts(OxtsRecord &record);

    void reset() override;

    const std::vector<std::string> &oxtFieldNames() const
    {
        return oxtFormats_;
    }

    bool hasOxts() const
    {
        return oxts_ != nullptr;
    }

private:
    std::optional<OxtsRecord> nextOxtsRecord();

    std::vector<std::string> oxtFormats_;
    std::unique_ptr<OxtsDatasetReader> oxts_;
};

// KITTI stereo benchmark ground truth (2012 or 2015), only the _10 images
class KITTIStereoGroundTruthDatasetReader
{

public:
    explicit KITTIStereoGroundTruthDatasetReader(const std::string &directory, bool is2015 = false, double scale = 1.0);

    // Stereo pair, disparities and per-frame calibration
    bool nextGroundTruthFrame(StereoGroundTruthFrame &frame);

    bool nextStereoFrame(StereoFrame &frame);

    // Stereo pair without pose
    bool nextFrame(KittiFrame &frame);

    void reset();

    size_t length() const
    {
        return stereo_.length();
    }

    double scale() const
    {
        return scale_;
    }

private:
    // Disparity PNG (uint16, px * 256) to float32 pixels, empty when absent
    static cv::Mat readDisparity(ImageDatasetReader &reader);

    double scale_;

    StereoDatasetReader stereo_;
    ImageDatasetReader noc_;
    ImageDatasetReader occ_;
    CalibDatasetReader calib_;
};

// Omnidirectional stereo + velodyne drives, no calibration
class OmnicamDatasetReader
{

public:
    OmnicamDatasetReader(const std::string &directory,
                         const std::string &sequence = "2013_05_14_drive_0008_sync",
                         const std::string &leftTemplate = "image_02/data/%010i.png",
                         const std::string &rightTemplate = "image_03/data/%010i.png",
                         const std::string &velodyneTemplate = "velodyne_points/data/%010i.bin",
                         int startIdx = 0, int maxFiles = 50000, double scale = 1.0);

    bool nextStereoFrame(StereoFrame &frame);

    bool nextVelodyneFrame(cv::Mat &cloud);

    bool nextStereoVelodyneFrame(KittiFrame &frame);

    void reset();

    const std::string &sequence() const
    {
        return sequence_;
    }

    size_t length() const
    {
        return stereo_->length();
    }

    bool hasVelodyne() const
    {
        return velodyne_ != nullptr;
    }

private:
    std::string sequence_;
    double scale_;

    std::unique_ptr<StereoDatasetReader> stereo_;
    std::unique_ptr<VelodyneDatasetReader> velodyne_;
};
