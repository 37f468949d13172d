#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include <opencv2/imgproc.hpp>
#include "config.hpp"

class FeatureDetector
{

public:
    explicit FeatureDetector(const DetectorParams &params);

    virtual ~FeatureDetector() = default;

    // Detects corners over the image pyramid. Pixels where mask is zero never
    // receive a feature; an empty mask allows the whole image.
    virtual std::vector<cv::Point2f> detect(const cv::Mat &image, const cv::Mat &mask = cv::Mat());

    const DetectorParams &params() const
    {
        return params_;
    }

private:
    std::vector<cv::KeyPoint> detectLevel(const cv::Mat &image, const cv::Mat &mask) const;

    // Keeps the strongest responses of every grid cell
    std::vector<cv::KeyPoint> bucket(const std::vector<cv::KeyPoint> &keypoints, const cv::Size &imageSize) const;

    DetectorParams params_;

    cv::Ptr<cv::FastFeatureDetector> fast_;
};
