#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>
#include <sophus/se3.hpp>
#include "stereo_calibration.hpp"

// One OXTS inertial/GPS record, values keyed by the dataformat field names
struct OxtsRecord
{
    std::vector<std::pair<std::string, double>> fields;

    std::optional<double> get(const std::string &name) const
    {
        for (const auto &field: fields)
        {
            if (field.first == name)
            {
                return field.second;
            }
        }

        return std::nullopt;
    }
};

struct StereoFrame
{
    size_t index = 0;
    cv::Mat left;
    cv::Mat right;
};

struct KittiFrame
{
    size_t index = 0;
    cv::Mat left;
    cv::Mat right;

    std::optional<Sophus::SE3d> pose;

    // N x 4 (x, y, z, reflectance)
    std::optional<cv::Mat> velodyne;
};

struct KittiRawFrame
{
    size_t index = 0;
    cv::Mat left;
    cv::Mat right;

    std::optional<Sophus::SE3d> pose;
    std::optional<cv::Mat> velodyne;
    std::optional<OxtsRecord> oxts;
};

struct StereoGroundTruthFrame
{
    size_t index = 0;
    cv::Mat left;
    cv::Mat right;

    // Disparities in pixels, depth is the occluded disparity map
    cv::Mat depth;
    cv::Mat noc;
    cv::Mat occ;

    std::optional<StereoCalibration> calib;
};
