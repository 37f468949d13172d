#pragma once

#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include "config.hpp"

class OpticalFlowTracker
{

public:
    virtual ~OpticalFlowTracker() = default;

    // Propagates prevPoints from prevImage into currImage. The result has the
    // same length as prevPoints and status[i] is false when point i was lost.
    virtual std::vector<cv::Point2f> track(
            const cv::Mat &prevImage,
            const cv::Mat &currImage,
            const std::vector<cv::Point2f> &prevPoints,
            std::vector<bool> &status
    ) = 0;

    static std::shared_ptr<OpticalFlowTracker> create(const TrackerParams &params);
};

// Pyramidal Lucas-Kanade with an optional forward-backward check
class LKTracker : public OpticalFlowTracker
{

public:
    explicit LKTracker(const TrackerParams &params);

    std::vector<cv::Point2f> track(
            const cv::Mat &prevImage,
            const cv::Mat &currImage,
            const std::vector<cv::Point2f> &prevPoints,
            std::vector<bool> &status
    ) override;

    // Forward-Backward KLT Tracking
    void fbKltTracking(
            const std::vector<cv::Mat> &prevPyramid,
            const std::vector<cv::Mat> &currPyramid,
            int numPyramidLevels,
            const std::vector<cv::Point2f> &points,
            std::vector<cv::Point2f> &trackedPoints,
            std::vector<bool> &keypointStatus
    ) const;

    bool inBorder(const cv::Point2f &point, const cv::Mat &image) const;

    const TrackerParams &params() const
    {
        return params_;
    }

private:
    TrackerParams params_;

    // KLT optimization parameter
    cv::TermCriteria kltConvCriteria_;
};
