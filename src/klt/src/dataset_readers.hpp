#pragma once

#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <sophus/se3.hpp>
#include "frame_records.hpp"
#include "stereo_calibration.hpp"

// Files generated from a printf template ("image_0/%06i.png"), starting at
// startIdx and stopping at the first missing index or after maxFiles files.
// Readers are cursors over that list; reset() restarts them.
class DatasetReader
{

public:
    DatasetReader(const std::string &pattern, int startIdx = 0, int maxFiles = 50000);

    virtual ~DatasetReader() = default;

    size_t length() const
    {
        return files_.size();
    }

    bool empty() const
    {
        return files_.empty();
    }

    const std::vector<std::string> &files() const
    {
        return files_;
    }

    const std::string &pattern() const
    {
        return pattern_;
    }

    size_t cursor() const
    {
        return cursor_;
    }

    void reset()
    {
        cursor_ = 0;
    }

protected:
    // Index of the next record and advances, false at the end
    bool advance(size_t &index);

    std::string pattern_;
    std::vector<std::string> files_;
    size_t cursor_ = 0;
};

class ImageDatasetReader : public DatasetReader
{

public:
    ImageDatasetReader(const std::string &pattern, int startIdx = 0, int maxFiles = 50000, double scale = 1.0, int readFlags = cv::IMREAD_UNCHANGED);

    cv::Mat read(size_t index) const;

    bool next(cv::Mat &image);

    double scale() const
    {
        return scale_;
    }

private:
    double scale_;
    int readFlags_;
};

// Left and right image readers advanced in lockstep
class StereoDatasetReader
{

public:
    StereoDatasetReader(const std::string &directory, const std::string &leftTemplate, const std::string &rightTemplate,
                        int startIdx = 0, int maxFiles = 50000, double scale = 1.0, int readFlags = cv::IMREAD_UNCHANGED);

    size_t length() const;

    StereoFrame read(size_t index) const;

    bool next(StereoFrame &frame);

    void reset();

    const ImageDatasetReader &left() const
    {
        return left_;
    }

    const ImageDatasetReader &right() const
    {
        return right_;
    }

private:
    ImageDatasetReader left_;
    ImageDatasetReader right_;
    size_t cursor_ = 0;
};

// Raw velodyne scans: little-endian float32 (x, y, z, reflectance) records
class VelodyneDatasetReader : public DatasetReader
{

public:
    VelodyneDatasetReader(const std::string &pattern, int startIdx = 0, int maxFiles = 50000);

    // N x 4 CV_32F matrix
    cv::Mat read(size_t index) const;

    bool next(cv::Mat &cloud);

    static cv::Mat readScan(const std::string &filename);
};

// Every pose of a KITTI pose file, loaded once
class PoseFileReader
{

public:
    explicit PoseFileReader(const std::string &filename);

    size_t length() const
    {
        return poses_.size();
    }

    const Sophus::SE3d &read(size_t index) const
    {
        return poses_.at(index);
    }

    bool next(Sophus::SE3d &pose);

    void reset()
    {
        cursor_ = 0;
    }

    const std::vector<Sophus::SE3d> &poses() const
    {
        return poses_;
    }

private:
    std::string filename_;
    std::vector<Sophus::SE3d> poses_;
    size_t cursor_ = 0;
};

class OxtsDatasetReader : public DatasetReader
{

public:
    OxtsDatasetReader(const std::string &pattern, const std::vector<std::string> &fieldNames, int startIdx = 0, int maxFiles = 50000);

    OxtsRecord read(size_t index) const;

    bool next(OxtsRecord &record);

    const std::vector<std::string> &fieldNames() const
    {
        return fieldNames_;
    }

    // Field names of oxts/dataformat.txt, the text before ':' on every line
    static std::vector<std::string> readFieldNames(const std::string &formatFile);

private:
    std::vector<std::string> fieldNames_;
};

// One calibration file per index, parsed with readKittiStereoCalib
class CalibDatasetReader : public DatasetReader
{

public:
    CalibDatasetReader(const std::string &pattern, const std::string &leftKey, const std::string &rightKey,
                       double scale = 1.0, int startIdx = 0, int maxFiles = 50000);

    StereoCalibration read(size_t index) const;

    bool next(std::optional<StereoCalibration> &calib);

private:
    std::string leftKey_;
    std::string rightKey_;
    double scale_;
};
