#include "optical_flow_tracker.hpp"
#include <opencv2/video/tracking.hpp>

std::shared_ptr<OpticalFlowTracker> OpticalFlowTracker::create(const TrackerParams &params)
{
    params.validate();
    return std::make_shared<LKTracker>(params);
}

LKTracker::LKTracker(const TrackerParams &params)
        : params_(params), kltConvCriteria_(params.termCriteria())
{
}

std::vector<cv::Point2f> LKTracker::track(const cv::Mat &prevImage, const cv::Mat &currImage,
                                          const std::vector<cv::Point2f> &prevPoints, std::vector<bool> &status)
{
    status.assign(prevPoints.size(), false);

    std::vector<cv::Point2f> trackedPoints(prevPoints);

    if (prevPoints.empty() || prevImage.empty() || currImage.empty() || prevImage.size() != currImage.size())
    {
        return trackedPoints;
    }

    cv::Size kltWinSize(params_.winSize_, params_.winSize_);

    std::vector<cv::Mat> prevPyramid;
    std::vector<cv::Mat> currPyramid;

    int numLevels = cv::buildOpticalFlowPyramid(prevImage, prevPyramid, kltWinSize, params_.maxLevel_);
    cv::buildOpticalFlowPyramid(currImage, currPyramid, kltWinSize, numLevels);

    fbKltTracking(prevPyramid, currPyramid, numLevels, prevPoints, trackedPoints, status);

    return trackedPoints;
}

void LKTracker::fbKltTracking(const std::vector<cv::Mat> &prevPyramid, const std::vector<cv::Mat> &currPyramid,
                              int numPyramidLevels, const std::vector<cv::Point2f> &points,
                              std::vector<cv::Point2f> &trackedPoints, std::vector<bool> &keypointStatus) const
{
    size_t numKeypoints = points.size();
    keypointStatus.assign(numKeypoints, false);

    if (points.empty() || prevPyramid.empty() || prevPyramid.size() != currPyramid.size())
    {
        return;
    }

    cv::Size kltWinSize(params_.winSize_, params_.winSize_);

    // Objects for OpenCV KLT
    std::vector<uchar> status;
    std::vector<float> errors;
    std::vector<int> keypointIndex;
    status.reserve(numKeypoints);
    errors.reserve(numKeypoints);
    keypointIndex.reserve(numKeypoints);

    // Initial flow is the previous position
    trackedPoints = points;

    // Tracking Forward
    cv::calcOpticalFlowPyrLK(prevPyramid, currPyramid, points, trackedPoints, status, errors,
                             kltWinSize, numPyramidLevels, kltConvCriteria_, cv::OPTFLOW_USE_INITIAL_FLOW
    );

    std::vector<cv::Point2f> newKeypoints;
    std::vector<cv::Point2f> backKeypoints;
    newKeypoints.reserve(numKeypoints);
    backKeypoints.reserve(numKeypoints);

    for (size_t i = 0; i < numKeypoints; i++)
    {
        if (!status.at(i))
        {
            continue;
        }

        if (params_.maxError_ > 0 && errors.at(i) > params_.maxError_)
        {
            continue;
        }

        if (!inBorder(trackedPoints.at(i), currPyramid.at(0)))
        {
            continue;
        }

        keypointStatus.at(i) = true;

        newKeypoints.push_back(trackedPoints.at(i));
        backKeypoints.push_back(points.at(i));
        keypointIndex.push_back(static_cast<int>(i));
    }

    if (!params_.fbCheck_ || newKeypoints.empty())
    {
        return;
    }

    status.clear();
    errors.clear();

    // Tracking Backward
    cv::calcOpticalFlowPyrLK(currPyramid, prevPyramid, newKeypoints, backKeypoints, status, errors,
                             kltWinSize, numPyramidLevels, kltConvCriteria_, cv::OPTFLOW_USE_INITIAL_FLOW
    );

    int n = static_cast<int>(newKeypoints.size());

    for (int i = 0; i < n; i++)
    {
        int idx = keypointIndex.at(i);

        if (!status.at(i))
        {
            keypointStatus.at(idx) = false;
            continue;
        }

        if (cv::norm(points.at(idx) - backKeypoints.at(i)) > params_.maxFbDistance_)
        {
            keypointStatus.at(idx) = false;
        }
    }
}

bool LKTracker::inBorder(const cv::Point2f &point, const cv::Mat &image) const
{
    const float BORDER_SIZE = 1.0;

    // True if point is within image borders
    return BORDER_SIZE <= point.x && point.x < image.cols - BORDER_SIZE && BORDER_SIZE <= point.y && point.y < image.rows - BORDER_SIZE;
}
