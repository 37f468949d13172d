#include "klt.hpp"
#include "image_utils.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>

static const int NUM_COLOR_BINS = 20;

BaseKLT::BaseKLT(const KltParams &params, std::shared_ptr<FeatureDetector> detector, std::shared_ptr<OpticalFlowTracker> tracker)
        : params_(params), detector_(detector), tracker_(tracker), trackManager_(params.maxTrackLength_)
{
    params_.validate();

    if (!detector_ || !tracker_)
    {
        throw std::runtime_error("KLT requires a feature detector and an optical-flow tracker");
    }

    trackManager_.debug_ = params_.debug_;

    if (params_.debug_)
    {
        params_.print(std::cout);
    }
}

void BaseKLT::drawTracks(cv::Mat &out, bool colored, TrackColoring coloring) const
{
    const auto &tracks = trackManager_.tracks();

    if (tracks.empty())
    {
        return;
    }

    std::vector<cv::Scalar> colors;

    if (coloring == TrackColoring::Age)
    {
        std::vector<cv::Scalar> wheel = ImageUtils::colorWheel(NUM_COLOR_BINS);

        for (const auto &it: tracks)
        {
            colors.push_back(wheel[it.first % NUM_COLOR_BINS]);
        }
    }
    else
    {
        std::vector<int> lengths;
        lengths.reserve(tracks.size());

        for (const auto &it: tracks)
        {
            lengths.push_back(static_cast<int>(it.second.length()));
        }

        colors = ImageUtils::colormap(lengths);
    }

    const cv::Scalar green(0, 255, 0);

    size_t k = 0;

    for (const auto &it: tracks)
    {
        const Track &track = it.second;

        std::vector<std::vector<cv::Point>> polyline(1);
        polyline[0].reserve(track.length());

        for (const auto &pt: track.items())
        {
            polyline[0].emplace_back(static_cast<int>(pt.x), static_cast<int>(pt.y));
        }

        cv::polylines(out, polyline, false, colored ? colors[k] : green, 1);

        const cv::Point latest = polyline[0].back();
        cv::rectangle(out, latest - cv::Point(2, 2), latest + cv::Point(2, 2), green, -1);

        k++;
    }
}

void BaseKLT::viz(cv::Mat &out, bool colored) const
{
    if (trackManager_.empty())
    {
        return;
    }

    std::vector<cv::Scalar> wheel = ImageUtils::colorWheel(NUM_COLOR_BINS);

    for (const auto &it: trackManager_.tracks())
    {
        const cv::Point2f &pt = it.second.latestItem();

        if (!ImageUtils::finiteAndWithinBounds(pt, out.size()))
        {
            continue;
        }

        cv::circle(out, cv::Point(static_cast<int>(pt.x), static_cast<int>(pt.y)), 2,
                   colored ? wheel[it.first % NUM_COLOR_BINS] : cv::Scalar(0, 240, 0), -1, cv::LINE_AA);
    }
}

// Resolves a history offset against a track length, -1 when out of range
static int resolveIndex(int index, size_t length)
{
    const int n = static_cast<int>(length);

    if (index < 0)
    {
        return n + index >= 0 ? n + index : -1;
    }

    return index < n ? index : -1;
}

TrackMatches BaseKLT::matches(int index1, int index2) const
{
    TrackMatches result;

    for (const auto &it: trackManager_.tracks())
    {
        const Track &track = it.second;

        int i1 = resolveIndex(index1, track.length());
        int i2 = resolveIndex(index2, track.length());

        if (i1 < 0 || i2 < 0)
        {
            continue;
        }

        result.ids.push_back(it.first);
        result.points1.push_back(track.items()[i1]);
        result.points2.push_back(track.items()[i2]);
    }

    return result;
}

OpenCVKLT::OpenCVKLT(const KltParams &params)
        : BaseKLT(params, std::make_shared<FeatureDetector>(params.detector_), OpticalFlowTracker::create(params.tracker_))
{
}

OpenCVKLT::OpenCVKLT(const KltParams &params, std::shared_ptr<FeatureDetector> detector, std::shared_ptr<OpticalFlowTracker> tracker)
        : BaseKLT(params, detector, tracker)
{
}

void OpenCVKLT::reset()
{
    state_ = KltState::Replenishing;
}

cv::Mat OpenCVKLT::createMask(const cv::Size &size, const std::vector<cv::Point2f> &points) const
{
    cv::Mat mask(size, CV_8UC1, cv::Scalar(255));

    for (const auto &pt: points)
    {
        if (!std::isfinite(pt.x) || !std::isfinite(pt.y))
        {
            continue;
        }

        // One extra pixel covers the sub-pixel part of the centre
        cv::circle(mask, cv::Point(cvRound(pt.x), cvRound(pt.y)), params_.maskRadius_ + 1, cv::Scalar(0), -1, cv::LINE_8);
    }

    return mask;
}

cv::Mat OpenCVKLT::preprocessImage(const cv::Mat &image) const
{
    return ImageUtils::gaussianBlur(ImageUtils::to8Bit(ImageUtils::toGray(image)));
}

TrackResult OpenCVKLT::process(const cv::Mat &image, const std::vector<cv::Point2f> *detectedPoints)
{
    if (image.empty())
    {
        if (params_.debug_)
        {
            std::cout << "- [KLT]: Skipping empty image" << std::endl;
        }

        return TrackResult{trackManager_.ids(), trackManager_.pts()};
    }

    images_.push_back(preprocessImage(image));

    while (images_.size() > 2)
    {
        images_.pop_front();
    }

    // Track object
    if (!trackManager_.empty() && images_.size() == 2)
    {
        trackFeatures();
    }

    // Check if more features required
    if (state_ == KltState::NeedsBootstrap || trackManager_.empty() || trackManager_.size() < params_.minTracks_)
    {
        state_ = KltState::Replenishing;
    }

    // Initialize or add more features
    if (state_ == KltState::Replenishing)
    {
        addFeatures(detectedPoints);
    }

    return TrackResult{trackManager_.ids(), trackManager_.pts()};
}

void OpenCVKLT::trackFeatures()
{
    std::vector<int> prevIds = trackManager_.ids();
    std::vector<cv::Point2f> prevPoints = trackManager_.pts();

    std::vector<bool> status;
    std::vector<cv::Point2f> points = tracker_->track(images_[0], images_[1], prevPoints, status);

    const cv::Size imageSize = images_[1].size();

    std::vector<int> ids;
    std::vector<cv::Point2f> trackedPoints;
    ids.reserve(prevIds.size());
    trackedPoints.reserve(prevIds.size());

    if (points.size() == prevPoints.size() && status.size() == prevPoints.size())
    {
        for (size_t i = 0; i < points.size(); i++)
        {
            if (status[i] && ImageUtils::finiteAndWithinBounds(points[i], imageSize))
            {
                ids.push_back(prevIds[i]);
                trackedPoints.push_back(points[i]);
            }
        }
    }

    if (params_.debug_)
    {
        std::cout << "- [KLT]: " << trackedPoints.size() << " out of " << prevPoints.size() << " tracks propagated" << std::endl;
    }

    if (trackedPoints.empty())
    {
        trackManager_.clear();
        return;
    }

    trackManager_.add(trackedPoints, ids, true);
}

bool OpenCVKLT::isNearTrack(const cv::Point2f &point, const std::vector<cv::Point2f> &trackedPoints) const
{
    const float radius = static_cast<float>(params_.maskRadius_);

    for (const auto &pt: trackedPoints)
    {
        if (std::hypot(point.x - pt.x, point.y - pt.y) <= radius)
        {
            return true;
        }
    }

    return false;
}

void OpenCVKLT::addFeatures(const std::vector<cv::Point2f> *detectedPoints)
{
    const cv::Mat &image = images_.back();

    // Extract features
    const std::vector<cv::Point2f> trackedPoints = trackManager_.pts();
    cv::Mat mask = createMask(image.size(), trackedPoints);

    std::vector<cv::Point2f> candidates;

    if (detectedPoints == nullptr)
    {
        candidates = detector_->detect(image, mask);
    }
    else
    {
        candidates.reserve(detectedPoints->size());

        for (const auto &pt: *detectedPoints)
        {
            if (!ImageUtils::finiteAndWithinBounds(pt, image.size()))
            {
                continue;
            }

            if (mask.at<uchar>(static_cast<int>(pt.y), static_cast<int>(pt.x)) > 0)
            {
                candidates.push_back(pt);
            }
        }
    }

    // The pixel mask is coarser than the exclusion radius, check the exact distance
    std::vector<cv::Point2f> newPoints;
    newPoints.reserve(candidates.size());

    for (const auto &pt: candidates)
    {
        if (!isNearTrack(pt, trackedPoints))
        {
            newPoints.push_back(pt);
        }
    }

    trackManager_.add(newPoints, false);

    if (params_.debug_)
    {
        std::cout << "- [KLT]: Added " << newPoints.size() << " new features, " << trackManager_.size() << " tracks" << std::endl;
    }

    if (!newPoints.empty())
    {
        state_ = KltState::Tracking;
    }
}
