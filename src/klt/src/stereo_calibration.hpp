#pragma once

#include <iostream>
#include <string>

#include <Eigen/Core>
#include <Eigen/LU>

#include <opencv2/core.hpp>

// Rectified stereo intrinsics, immutable after construction
class StereoCalibration
{

public:
    EIGEN_MAKE_ALIGNED_OPERATOR_NEW

    StereoCalibration(double fx, double fy, double cx, double cy, double baselinePx, const cv::Size &shape = cv::Size());

    StereoCalibration scaled(double scale) const;

    // Baseline in meters
    double baseline() const
    {
        return baselinePx_ / fx_;
    }

    double fx() const
    {
        return fx_;
    }

    double fy() const
    {
        return fy_;
    }

    double cx() const
    {
        return cx_;
    }

    double cy() const
    {
        return cy_;
    }

    double baselinePx() const
    {
        return baselinePx_;
    }

    const cv::Size &shape() const
    {
        return shape_;
    }

    const Eigen::Matrix3d &K() const
    {
        return K_;
    }

    const Eigen::Matrix3d &inverseK() const
    {
        return inverseK_;
    }

    const cv::Mat &Kcv() const
    {
        return Kcv_;
    }

    // Depth in meters of a disparity in pixels, zero for invalid disparities
    double disparityToDepth(double disparity) const;

    bool operator==(const StereoCalibration &other) const;

private:
    double fx_, fy_, cx_, cy_;
    double baselinePx_;

    cv::Size shape_;

    Eigen::Matrix3d K_;
    Eigen::Matrix3d inverseK_;
    cv::Mat Kcv_;
};

std::ostream &operator<<(std::ostream &os, const StereoCalibration &calib);

struct KittiCalibration
{
    static const StereoCalibration kitti_00_02;
    static const StereoCalibration kitti_03;
    static const StereoCalibration kitti_04_12;

    // baselinePx / fx
    static constexpr double baseline = 0.5371;

    // Velodyne is 27 cm behind cam_0 (x-forward, y-left, z-up)
    static constexpr double velo2cam = 0.27;
};

// Calibration of a KITTI odometry sequence ("00" to "12")
StereoCalibration kittiStereoCalib(const std::string &sequence, double scale = 1.0);

// Reads a KITTI calibration file (YAML dictionary of 3x4 projection rows)
StereoCalibration readKittiStereoCalib(const std::string &filename, const std::string &leftKey, const std::string &rightKey, double scale = 1.0);
