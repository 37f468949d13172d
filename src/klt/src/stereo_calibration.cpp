#include "stereo_calibration.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <opencv2/core/eigen.hpp>
#include <yaml-cpp/yaml.h>

static const cv::Size KITTI_SHAPE(1241, 376);

const StereoCalibration KittiCalibration::kitti_00_02(718.86, 718.86, 607.19, 185.22, 386.1448, KITTI_SHAPE);
const StereoCalibration KittiCalibration::kitti_03(721.5377, 721.5377, 609.5593, 172.854, 387.5744, KITTI_SHAPE);
const StereoCalibration KittiCalibration::kitti_04_12(707.0912, 707.0912, 601.8873, 183.1104, 379.8145, KITTI_SHAPE);

StereoCalibration::StereoCalibration(double fx, double fy, double cx, double cy, double baselinePx, const cv::Size &shape)
        : fx_(fx), fy_(fy), cx_(cx), cy_(cy), baselinePx_(baselinePx), shape_(shape)
{
    if (fx_ <= 0. || fy_ <= 0.)
    {
        throw std::runtime_error("Stereo calibration requires positive focal lengths");
    }

    // intrinsics
    K_ << fx_, 0., cx_, 0., fy_, cy_, 0., 0., 1.;

    inverseK_ = K_.inverse();

    cv::eigen2cv(K_, Kcv_);
}

StereoCalibration StereoCalibration::scaled(double scale) const
{
    cv::Size shape(static_cast<int>(std::lround(shape_.width * scale)), static_cast<int>(std::lround(shape_.height * scale)));

    return StereoCalibration(fx_ * scale, fy_ * scale, cx_ * scale, cy_ * scale, baselinePx_ * scale, shape);
}

double StereoCalibration::disparityToDepth(double disparity) const
{
    if (!(disparity > 0.))
    {
        return 0.;
    }

    return baselinePx_ / disparity;
}

bool StereoCalibration::operator==(const StereoCalibration &other) const
{
    return fx_ == other.fx_ && fy_ == other.fy_ && cx_ == other.cx_ && cy_ == other.cy_ &&
           baselinePx_ == other.baselinePx_ && shape_ == other.shape_;
}

std::ostream &operator<<(std::ostream &os, const StereoCalibration &calib)
{
    os << "fx: " << calib.fx() << ", fy: " << calib.fy() << ", cx: " << calib.cx() << ", cy: " << calib.cy();
    os << ", baseline: " << calib.baselinePx() << " px (" << calib.baseline() << " m)";
    os << ", shape: " << calib.shape().width << "x" << calib.shape().height;
    return os;
}

StereoCalibration kittiStereoCalib(const std::string &sequence, double scale)
{
    int seq = -1;

    try
    {
        size_t pos = 0;
        seq = std::stoi(sequence, &pos);

        if (pos != sequence.size())
        {
            seq = -1;
        }
    }
    catch (const std::logic_error &)
    {
        seq = -1;
    }

    std::cout << "- [Dataset]: KITTI Dataset Reader: Sequence (" << sequence << ") @ Scale (" << scale << ")" << std::endl;

    if (seq >= 0 && seq <= 2)
    {
        return KittiCalibration::kitti_00_02.scaled(scale);
    }
    else if (seq == 3)
    {
        return KittiCalibration::kitti_03.scaled(scale);
    }
    else if (seq >= 4 && seq <= 12)
    {
        return KittiCalibration::kitti_04_12.scaled(scale);
    }

    throw std::runtime_error("Error retrieving stereo calibration for KITTI sequence " + sequence);
}

static std::vector<double> readProjectionRow(const YAML::Node &root, const std::string &key, const std::string &filename)
{
    if (!root[key])
    {
        throw std::runtime_error("Calibration " + filename + " has no entry " + key);
    }

    std::vector<double> values;
    std::istringstream ss(root[key].as<std::string>());

    double v;
    while (ss >> v)
    {
        values.push_back(v);
    }

    if (values.size() != 12 || !ss.eof())
    {
        throw std::runtime_error("Calibration " + filename + " entry " + key + " is not a 3x4 projection matrix");
    }

    return values;
}

StereoCalibration readKittiStereoCalib(const std::string &filename, const std::string &leftKey, const std::string &rightKey, double scale)
{
    YAML::Node root;

    try
    {
        root = YAML::LoadFile(filename);
    }
    catch (const YAML::Exception &e)
    {
        throw std::runtime_error("Failed to read calibration " + filename + ": " + e.what());
    }

    if (!root.IsMap())
    {
        throw std::runtime_error("Calibration " + filename + " is not a dictionary");
    }

    std::vector<double> P0;
    std::vector<double> P1;

    try
    {
        P0 = readProjectionRow(root, leftKey, filename);
        P1 = readProjectionRow(root, rightKey, filename);
    }
    catch (const YAML::Exception &e)
    {
        throw std::runtime_error("Malformed calibration " + filename + ": " + e.what());
    }

    double fx = P0[0];
    double cx = P0[2];
    double cy = P0[6];
    double baselinePx = std::fabs(P1[3]);

    return StereoCalibration(fx, fx, cx, cy, baselinePx).scaled(scale);
}
