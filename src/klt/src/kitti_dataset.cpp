#include "kitti_dataset.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

static std::string joinPath(const std::string &a, const std::string &b)
{
    return (fs::path(Utils::expandUser(a)) / b).string();
}

KITTIDatasetReader::KITTIDatasetReader(const std::string &directory, const std::string &sequence, double scale)
        : directory_(Utils::expandUser(directory)), sequence_(sequence), scale_(scale)
{
}

KITTIDatasetReader::KITTIDatasetReader(const std::string &directory, const std::string &sequence,
                                       const std::string &leftTemplate, const std::string &rightTemplate,
                                       const std::string &velodyneTemplate,
                                       int startIdx, int maxFiles, double scale)
        : KITTIDatasetReader(directory, sequence, scale)
{
    // Get calib, fatal for unknown sequences
    calib_ = kittiStereoCalib(sequence_, scale_);

    // Read stereo images
    std::string seqDirectory = joinPath(joinPath(directory_, "sequences"), sequence_);

    stereo_ = std::make_unique<StereoDatasetReader>(seqDirectory, leftTemplate, rightTemplate, startIdx, maxFiles, scale_);

    // Read poses
    openPoses(joinPath(joinPath(directory_, "poses"), sequence_ + ".txt"));

    // Read velodyne
    openVelodyne(joinPath(seqDirectory, velodyneTemplate), startIdx, maxFiles);

    std::cout << "- [Dataset]: Initialized stereo dataset reader with " << scale_ << " scale";
    std::cout << ", frames: " << stereo_->length();
    std::cout << ", poses: " << (poses_ ? poses_->length() : 0);
    std::cout << ", velodyne scans: " << (velodyne_ ? velodyne_->length() : 0) << std::endl;
}

void KITTIDatasetReader::openPoses(const std::string &filename)
{
    if (!fs::exists(filename))
    {
        std::cout << "- [Dataset]: No poses at " << filename << std::endl;
        poses_.reset();
        return;
    }

    try
    {
        poses_ = std::make_unique<PoseFileReader>(filename);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "- [Dataset]: Ignoring malformed pose file " << filename << ": " << e.what() << std::endl;
        poses_.reset();
    }
}

void KITTIDatasetReader::openVelodyne(const std::string &pattern, int startIdx, int maxFiles)
{
    auto velodyne = std::make_unique<VelodyneDatasetReader>(pattern, startIdx, maxFiles);

    if (velodyne->empty())
    {
        std::cout << "- [Dataset]: No velodyne scans at " << pattern << std::endl;
        velodyne_.reset();
        return;
    }

    velodyne_ = std::move(velodyne);
}

std::optional<Sophus::SE3d> KITTIDatasetReader::nextPose()
{
    Sophus::SE3d pose;

    if (poses_ && poses_->next(pose))
    {
        return pose;
    }

    return std::nullopt;
}

std::optional<cv::Mat> KITTIDatasetReader::nextVelodyne()
{
    cv::Mat cloud;

    if (velodyne_ && velodyne_->next(cloud))
    {
        return cloud;
    }

    return std::nullopt;
}

bool KITTIDatasetReader::nextStereoFrame(StereoFrame &frame)
{
    return stereo_->next(frame);
}

bool KITTIDatasetReader::nextFrame(KittiFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_->next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.pose = nextPose();
    frame.velodyne = std::nullopt;

    return true;
}

bool KITTIDatasetReader::nextVelodyneFrame(cv::Mat &cloud)
{
    return velodyne_ && velodyne_->next(cloud);
}

bool KITTIDatasetReader::nextStereoVelodyneFrame(KittiFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_->next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.pose = nextPose();
    frame.velodyne = nextVelodyne();

    return true;
}

void KITTIDatasetReader::reset()
{
    stereo_->reset();

    if (poses_)
    {
        poses_->reset();
    }

    if (velodyne_)
    {
        velodyne_->reset();
    }
}

std::vector<std::shared_ptr<KITTIDatasetReader>> KITTIDatasetReader::scenes(const std::vector<std::string> &sequences, const std::string &directory,
                                                                            const std::string &leftTemplate, const std::string &rightTemplate,
                                                                            const std::string &velodyneTemplate,
                                                                            int startIdx, int maxFiles, double scale)
{
    std::vector<std::shared_ptr<KITTIDatasetReader>> readers;
    readers.reserve(sequences.size());

    for (const auto &sequence: sequences)
    {
        readers.push_back(std::make_shared<KITTIDatasetReader>(directory, sequence, leftTemplate, rightTemplate, velodyneTemplate, startIdx, maxFiles, scale));
    }

    return readers;
}

KITTIRawDatasetReader::KITTIRawDatasetReader(const std::string &directory, const std::string &sequence,
                                             const std::string &leftTemplate, const std::string &rightTemplate,
                                             const std::string &velodyneTemplate, const std::string &oxtTemplate,
                                             int startIdx, int maxFiles, double scale)
        : KITTIDatasetReader(directory, sequence, scale)
{
    if (!sequence_.empty())
    {
        calib_ = kittiStereoCalib(sequence_, scale_);
    }

    // Read stereo images
    stereo_ = std::make_unique<StereoDatasetReader>(directory_, leftTemplate, rightTemplate, startIdx, maxFiles, scale_);

    // Read poses
    if (!sequence_.empty())
    {
        openPoses(joinPath(joinPath(directory_, "poses"), sequence_ + ".txt"));
    }

    // Read velodyne
    openVelodyne(joinPath(directory_, velodyneTemplate), startIdx, maxFiles);

    // Read oxts
    std::string formatFile = joinPath(directory_, "oxts/dataformat.txt");

    if (fs::exists(formatFile))
    {
        oxtFormats_ = OxtsDatasetReader::readFieldNames(formatFile);

        auto oxts = std::make_unique<OxtsDatasetReader>(joinPath(directory_, oxtTemplate), oxtFormats_, startIdx, maxFiles);

        if (!oxts->empty())
        {
            oxts_ = std::move(oxts);
        }
    }

    if (!oxts_)
    {
        std::cout << "- [Dataset]: No OXTS records in " << directory_ << std::endl;
    }

    std::cout << "- [Dataset]: Initialized raw dataset reader with " << scale_ << " scale";
    std::cout << ", frames: " << stereo_->length();
    std::cout << ", oxts: " << (oxts_ ? oxts_->length() : 0) << std::endl;
}

std::optional<OxtsRecord> KITTIRawDatasetReader::nextOxtsRecord()
{
    OxtsRecord record;

    if (oxts_ && oxts_->next(record))
    {
        return record;
    }

    return std::nullopt;
}

bool KITTIRawDatasetReader::nextFrame(KittiRawFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_->next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.pose = nextPose();
    frame.velodyne = std::nullopt;
    frame.oxts = nextOxtsRecord();

    return true;
}

bool KITTIRawDatasetReader::nextOxts(OxtsRecord &record)
{
    return oxts_ && oxts_->next(record);
}

void KITTIRawDatasetReader::reset()
{
    KITTIDatasetReader::reset();

    if (oxts_)
    {
        oxts_->reset();
    }
}

KITTIStereoGroundTruthDatasetReader::KITTIStereoGroundTruthDatasetReader(const std::string &directory, bool is2015, double scale)
        : scale_(scale),
          stereo_(directory,
                  is2015 ? "image_2/%06i_10.png" : "image_0/%06i_10.png",
                  is2015 ? "image_3/%06i_10.png" : "image_1/%06i_10.png",
                  0, 50000, scale, cv::IMREAD_GRAYSCALE),
          noc_(joinPath(directory, is2015 ? "disp_noc_0/%06i_10.png" : "disp_noc/%06i_10.png"), 0, 50000, 1.0, cv::IMREAD_UNCHANGED),
          occ_(joinPath(directory, is2015 ? "disp_occ_0/%06i_10.png" : "disp_occ/%06i_10.png"), 0, 50000, 1.0, cv::IMREAD_UNCHANGED),
          calib_(joinPath(directory, "calib/%06i.txt"), is2015 ? "P2" : "P0", is2015 ? "P3" : "P1", scale)
{
    std::cout << "- [Dataset]: Initialized stereo ground truth reader with " << scale_ << " scale";
    std::cout << ", frames: " << stereo_.length();
    std::cout << ", disparities: " << occ_.length() << std::endl;
}

cv::Mat KITTIStereoGroundTruthDatasetReader::readDisparity(ImageDatasetReader &reader)
{
    cv::Mat disparity;

    if (!reader.next(disparity))
    {
        return cv::Mat();
    }

    cv::Mat result;
    disparity.convertTo(result, CV_32F, 1.0 / 256.0);
    return result;
}

bool KITTIStereoGroundTruthDatasetReader::nextGroundTruthFrame(StereoGroundTruthFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_.next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.noc = readDisparity(noc_);
    frame.occ = readDisparity(occ_);
    frame.depth = frame.occ.clone();

    if (!calib_.next(frame.calib))
    {
        frame.calib = std::nullopt;
    }

    return true;
}

bool KITTIStereoGroundTruthDatasetReader::nextStereoFrame(StereoFrame &frame)
{
    return stereo_.next(frame);
}

bool KITTIStereoGroundTruthDatasetReader::nextFrame(KittiFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_.next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.pose = std::nullopt;
    frame.velodyne = std::nullopt;

    return true;
}

void KITTIStereoGroundTruthDatasetReader::reset()
{
    stereo_.reset();
    noc_.reset();
    occ_.reset();
    calib_.reset();
}

OmnicamDatasetReader::OmnicamDatasetReader(const std::string &directory, const std::string &sequence,
                                           const std::string &leftTemplate, const std::string &rightTemplate,
                                           const std::string &velodyneTemplate,
                                           int startIdx, int maxFiles, double scale)
        : sequence_(sequence), scale_(scale)
{
    // Read stereo images
    std::string seqDirectory = joinPath(directory, sequence_);

    stereo_ = std::make_unique<StereoDatasetReader>(seqDirectory, leftTemplate, rightTemplate, startIdx, maxFiles, scale_);

    // Read velodyne
    auto velodyne = std::make_unique<VelodyneDatasetReader>(joinPath(seqDirectory, velodyneTemplate), startIdx, maxFiles);

    if (!velodyne->empty())
    {
        velodyne_ = std::move(velodyne);
    }

    std::cout << "- [Dataset]: Initialized omnicam dataset reader with " << scale_ << " scale";
    std::cout << ", frames: " << stereo_->length();
    std::cout << ", velodyne scans: " << (velodyne_ ? velodyne_->length() : 0) << std::endl;
}

bool OmnicamDatasetReader::nextStereoFrame(StereoFrame &frame)
{
    return stereo_->next(frame);
}

bool OmnicamDatasetReader::nextVelodyneFrame(cv::Mat &cloud)
{
    return velodyne_ && velodyne_->next(cloud);
}

bool OmnicamDatasetReader::nextStereoVelodyneFrame(KittiFrame &frame)
{
    StereoFrame stereo;

    if (!stereo_->next(stereo))
    {
        return false;
    }

    frame.index = stereo.index;
    frame.left = stereo.left;
    frame.right = stereo.right;
    frame.pose = std::nullopt;
    frame.velodyne = std::nullopt;

    cv::Mat cloud;
    if (velodyne_ && velodyne_->next(cloud))
    {
        frame.velodyne = cloud;
    }

    return true;
}

void OmnicamDatasetReader::reset()
{
    stereo_->reset();

    if (velodyne_)
    {
        velodyne_->reset();
    }
}
