#pragma once

#include <deque>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include "config.hpp"
#include "feature_detector.hpp"
#include "optical_flow_tracker.hpp"
#include "track_manager.hpp"

enum class KltState
{
    // No prior frame or no tracks yet
    NeedsBootstrap,
    Tracking,
    // Waiting for new features, kept until some are actually added
    Replenishing
};

enum class TrackColoring
{
    Age,
    Length
};

struct TrackResult
{
    std::vector<int> ids;
    std::vector<cv::Point2f> points;
};

struct TrackMatches
{
    std::vector<int> ids;
    std::vector<cv::Point2f> points1;
    std::vector<cv::Point2f> points2;

    bool empty() const
    {
        return ids.empty();
    }
};

// General-purpose KLT tracker combining a FeatureDetector and an OpticalFlowTracker
class BaseKLT
{

public:
    BaseKLT(const KltParams &params, std::shared_ptr<FeatureDetector> detector, std::shared_ptr<OpticalFlowTracker> tracker);

    virtual ~BaseKLT() = default;

    // Tracks existing features into image and adds new ones when required.
    // When detectedPoints is given it replaces the detector as the source of
    // candidate features.
    virtual TrackResult process(const cv::Mat &image, const std::vector<cv::Point2f> *detectedPoints = nullptr) = 0;

    // Draws the history of every track as a polyline
    void drawTracks(cv::Mat &out, bool colored = false, TrackColoring coloring = TrackColoring::Length) const;

    // Draws the latest point of every track
    void viz(cv::Mat &out, bool colored = false) const;

    // Point pairs at two history offsets of every track long enough to have
    // both. Negative offsets count from the most recent observation.
    TrackMatches matches(int index1 = -2, int index2 = -1) const;

    const TrackManager &trackManager() const
    {
        return trackManager_;
    }

    const KltParams &params() const
    {
        return params_;
    }

protected:
    KltParams params_;

    std::shared_ptr<FeatureDetector> detector_;
    std::shared_ptr<OpticalFlowTracker> tracker_;

    TrackManager trackManager_;
};

// KLT tracker in the manner of the OpenCV lk_track sample
class OpenCVKLT : public BaseKLT
{

public:
    explicit OpenCVKLT(const KltParams &params);

    OpenCVKLT(const KltParams &params, std::shared_ptr<FeatureDetector> detector, std::shared_ptr<OpticalFlowTracker> tracker);

    TrackResult process(const cv::Mat &image, const std::vector<cv::Point2f> *detectedPoints = nullptr) override;

    // Requests new features on the next call, existing tracks are kept
    void reset();

    // Mask with a zero disk around every point
    cv::Mat createMask(const cv::Size &size, const std::vector<cv::Point2f> &points) const;

    KltState state() const
    {
        return state_;
    }

    bool needsReplenish() const
    {
        return state_ != KltState::Tracking;
    }

    size_t numBufferedImages() const
    {
        return images_.size();
    }

private:
    cv::Mat preprocessImage(const cv::Mat &image) const;

    void trackFeatures();

    void addFeatures(const std::vector<cv::Point2f> *detectedPoints);

    bool isNearTrack(const cv::Point2f &point, const std::vector<cv::Point2f> &trackedPoints) const;

    // Two most recent preprocessed images
    std::deque<cv::Mat> images_;

    KltState state_ = KltState::NeedsBootstrap;
};
