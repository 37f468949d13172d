#include "dataset_readers.hpp"
#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

DatasetReader::DatasetReader(const std::string &pattern, int startIdx, int maxFiles)
        : pattern_(Utils::expandUser(pattern))
{
    for (int k = 0; k < maxFiles; k++)
    {
        // Stop at the last representable index
        if (startIdx > std::numeric_limits<int>::max() - k)
        {
            break;
        }

        std::string filename = Utils::formatTemplate(pattern_, startIdx + k);

        if (!fs::exists(filename))
        {
            break;
        }

        files_.push_back(filename);
    }
}

bool DatasetReader::advance(size_t &index)
{
    if (cursor_ >= files_.size())
    {
        return false;
    }

    index = cursor_++;
    return true;
}

ImageDatasetReader::ImageDatasetReader(const std::string &pattern, int startIdx, int maxFiles, double scale, int readFlags)
        : DatasetReader(pattern, startIdx, maxFiles), scale_(scale), readFlags_(readFlags)
{
}

cv::Mat ImageDatasetReader::read(size_t index) const
{
    const std::string &filename = files_.at(index);

    cv::Mat image = cv::imread(filename, readFlags_);

    if (image.empty())
    {
        throw std::runtime_error("Failed to read image " + filename);
    }

    if (scale_ != 1.0)
    {
        cv::Mat scaled;
        cv::resize(image, scaled, cv::Size(), scale_, scale_, scale_ < 1.0 ? cv::INTER_AREA : cv::INTER_LINEAR);
        image = scaled;
    }

    return image;
}

bool ImageDatasetReader::next(cv::Mat &image)
{
    size_t index;

    if (!advance(index))
    {
        return false;
    }

    image = read(index);
    return true;
}

static std::string joinPath(const std::string &directory, const std::string &pattern)
{
    fs::path p(Utils::expandUser(pattern));

    if (p.is_absolute() || directory.empty())
    {
        return p.string();
    }

    return (fs::path(Utils::expandUser(directory)) / p).string();
}

StereoDatasetReader::StereoDatasetReader(const std::string &directory, const std::string &leftTemplate, const std::string &rightTemplate,
                                         int startIdx, int maxFiles, double scale, int readFlags)
        : left_(joinPath(directory, leftTemplate), startIdx, maxFiles, scale, readFlags),
          right_(joinPath(directory, rightTemplate), startIdx, maxFiles, scale, readFlags)
{
    if (left_.length() != right_.length())
    {
        std::cerr << "- [Dataset]: Stereo image count mismatch, left: " << left_.length() << ", right: " << right_.length() << std::endl;
    }
}

size_t StereoDatasetReader::length() const
{
    return std::min(left_.length(), right_.length());
}

StereoFrame StereoDatasetReader::read(size_t index) const
{
    StereoFrame frame;
    frame.index = index;
    frame.left = left_.read(index);
    frame.right = right_.read(index);
    return frame;
}

bool StereoDatasetReader::next(StereoFrame &frame)
{
    if (cursor_ >= length())
    {
        return false;
    }

    frame = read(cursor_++);
    return true;
}

void StereoDatasetReader::reset()
{
    cursor_ = 0;
    left_.reset();
    right_.reset();
}

VelodyneDatasetReader::VelodyneDatasetReader(const std::string &pattern, int startIdx, int maxFiles)
        : DatasetReader(pattern, startIdx, maxFiles)
{
}

cv::Mat VelodyneDatasetReader::readScan(const std::string &filename)
{
    std::ifstream file(filename, std::ios::binary | std::ios::ate);

    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open velodyne scan " + filename);
    }

    const std::streamsize numBytes = file.tellg();
    const std::streamsize recordSize = 4 * sizeof(float);

    if (numBytes < 0 || numBytes % recordSize != 0)
    {
        throw std::runtime_error("Velodyne scan " + filename + " is not a sequence of 4 float records");
    }

    cv::Mat cloud(static_cast<int>(numBytes / recordSize), 4, CV_32F);

    file.seekg(0, std::ios::beg);

    if (numBytes > 0 && !file.read(reinterpret_cast<char *>(cloud.data), numBytes))
    {
        throw std::runtime_error("Failed to read velodyne scan " + filename);
    }

    return cloud;
}

cv::Mat VelodyneDatasetReader::read(size_t index) const
{
    return readScan(files_.at(index));
}

bool VelodyneDatasetReader::next(cv::Mat &cloud)
{
    size_t index;

    if (!advance(index))
    {
        return false;
    }

    cloud = read(index);
    return true;
}

PoseFileReader::PoseFileReader(const std::string &filename)
        : filename_(Utils::expandUser(filename)), poses_(Utils::loadKittiPoses(filename_))
{
}

bool PoseFileReader::next(Sophus::SE3d &pose)
{
    if (cursor_ >= poses_.size())
    {
        return false;
    }

    pose = poses_[cursor_++];
    return true;
}

OxtsDatasetReader::OxtsDatasetReader(const std::string &pattern, const std::vector<std::string> &fieldNames, int startIdx, int maxFiles)
        : DatasetReader(pattern, startIdx, maxFiles), fieldNames_(fieldNames)
{
}

OxtsRecord OxtsDatasetReader::read(size_t index) const
{
    const std::string &filename = files_.at(index);

    std::ifstream file(filename);

    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open OXTS record " + filename);
    }

    OxtsRecord record;
    record.fields.reserve(fieldNames_.size());

    double v;
    size_t k = 0;

    // Values beyond the known field names are dropped
    while (k < fieldNames_.size() && file >> v)
    {
        record.fields.emplace_back(fieldNames_[k++], v);
    }

    if (k < fieldNames_.size() && !file.eof())
    {
        throw std::runtime_error("OXTS record " + filename + " contains a non-numeric value");
    }

    return record;
}

bool OxtsDatasetReader::next(OxtsRecord &record)
{
    size_t index;

    if (!advance(index))
    {
        return false;
    }

    record = read(index);
    return true;
}

std::vector<std::string> OxtsDatasetReader::readFieldNames(const std::string &formatFile)
{
    std::ifstream file(Utils::expandUser(formatFile));

    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open OXTS data format " + formatFile);
    }

    std::vector<std::string> names;
    std::string line;

    while (std::getline(file, line))
    {
        std::string name = line.substr(0, line.find(':'));

        name.erase(0, name.find_first_not_of(" \t\r"));
        name.erase(name.find_last_not_of(" \t\r") + 1);

        if (!name.empty())
        {
            names.push_back(name);
        }
    }

    return names;
}

CalibDatasetReader::CalibDatasetReader(const std::string &pattern, const std::string &leftKey, const std::string &rightKey,
                                       double scale, int startIdx, int maxFiles)
        : DatasetReader(pattern, startIdx, maxFiles), leftKey_(leftKey), rightKey_(rightKey), scale_(scale)
{
}

StereoCalibration CalibDatasetReader::read(size_t index) const
{
    return readKittiStereoCalib(files_.at(index), leftKey_, rightKey_, scale_);
}

bool CalibDatasetReader::next(std::optional<StereoCalibration> &calib)
{
    size_t index;

    if (!advance(index))
    {
        return false;
    }

    calib = read(index);
    return true;
}
