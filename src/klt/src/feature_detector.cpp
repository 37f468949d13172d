#include "feature_detector.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

FeatureDetector::FeatureDetector(const DetectorParams &params) : params_(params)
{
    params_.validate();

    fast_ = cv::FastFeatureDetector::create(params_.fastThreshold_, params_.fastNonMaxSuppression_);
}

std::vector<cv::Point2f> FeatureDetector::detect(const cv::Mat &image, const cv::Mat &mask)
{
    if (image.empty())
    {
        return std::vector<cv::Point2f>();
    }

    if (!mask.empty() && (mask.size() != image.size() || mask.type() != CV_8UC1))
    {
        throw std::runtime_error("Detection mask must be a CV_8UC1 image of the input size");
    }

    cv::Mat levelImage = image;
    cv::Mat levelMask = mask;

    std::vector<cv::KeyPoint> keypoints;

    for (int level = 0; level < params_.maxLevels_; level++)
    {
        if (level > 0)
        {
            if (levelImage.cols < 16 || levelImage.rows < 16)
            {
                break;
            }

            cv::Mat downImage;
            cv::pyrDown(levelImage, downImage);
            levelImage = downImage;

            if (!mask.empty())
            {
                cv::Mat downMask;
                cv::resize(mask, downMask, levelImage.size(), 0, 0, cv::INTER_NEAREST);
                levelMask = downMask;
            }
        }

        std::vector<cv::KeyPoint> levelKeypoints = detectLevel(levelImage, levelMask);

        const float scale = static_cast<float>(1 << level);

        for (auto &kp: levelKeypoints)
        {
            kp.pt *= scale;
            kp.octave = level;
            keypoints.push_back(kp);
        }
    }

    keypoints = bucket(keypoints, image.size());

    std::vector<cv::Point2f> detectedPx;
    detectedPx.reserve(keypoints.size());

    for (const auto &kp: keypoints)
    {
        // Upscaled coarse-level points may land on a masked pixel
        int x = std::min(std::max(static_cast<int>(kp.pt.x), 0), image.cols - 1);
        int y = std::min(std::max(static_cast<int>(kp.pt.y), 0), image.rows - 1);

        if (!mask.empty() && mask.at<uchar>(y, x) == 0)
        {
            continue;
        }

        detectedPx.push_back(kp.pt);
    }

    // Compute Corners with Sub-Pixel Accuracy
    if (params_.subpixel_ && !detectedPx.empty())
    {
        cv::Size winSize = cv::Size(3, 3);
        cv::Size zeroZone = cv::Size(-1, -1);
        cv::TermCriteria criteria = cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::MAX_ITER, 30, 0.01);
        cv::cornerSubPix(image, detectedPx, winSize, zeroZone, criteria);

        if (!mask.empty())
        {
            detectedPx.erase(std::remove_if(detectedPx.begin(), detectedPx.end(), [&](const cv::Point2f &px) {
                int x = std::min(std::max(static_cast<int>(px.x), 0), image.cols - 1);
                int y = std::min(std::max(static_cast<int>(px.y), 0), image.rows - 1);
                return mask.at<uchar>(y, x) == 0;
            }), detectedPx.end());
        }
    }

    return detectedPx;
}

std::vector<cv::KeyPoint> FeatureDetector::detectLevel(const cv::Mat &image, const cv::Mat &mask) const
{
    std::vector<cv::KeyPoint> keypoints;

    if (params_.method_ == DetectionMethod::Fast)
    {
        fast_->detect(image, keypoints, mask);
        return keypoints;
    }

    std::vector<cv::Point2f> corners;
    cv::goodFeaturesToTrack(image, corners, params_.maxCorners_, params_.gfttQuality_, params_.gfttMinDistance_, mask);

    keypoints.reserve(corners.size());

    // goodFeaturesToTrack returns corners sorted by decreasing quality
    float response = static_cast<float>(corners.size());
    for (const auto &corner: corners)
    {
        keypoints.emplace_back(corner, 1.f, -1.f, response);
        response -= 1.f;
    }

    return keypoints;
}

std::vector<cv::KeyPoint> FeatureDetector::bucket(const std::vector<cv::KeyPoint> &keypoints, const cv::Size &imageSize) const
{
    const int numCells = params_.gridCols_ * params_.gridRows_;
    const size_t maxPerCell = static_cast<size_t>(std::max(1, params_.maxCorners_ / numCells));

    const float cellW = static_cast<float>(imageSize.width) / params_.gridCols_;
    const float cellH = static_cast<float>(imageSize.height) / params_.gridRows_;

    std::vector<std::vector<cv::KeyPoint>> cells(numCells);

    for (const auto &kp: keypoints)
    {
        int c = std::min(static_cast<int>(kp.pt.x / cellW), params_.gridCols_ - 1);
        int r = std::min(static_cast<int>(kp.pt.y / cellH), params_.gridRows_ - 1);

        if (c < 0 || r < 0)
        {
            continue;
        }

        cells[r * params_.gridCols_ + c].push_back(kp);
    }

    std::vector<cv::KeyPoint> result;
    result.reserve(std::min(keypoints.size(), static_cast<size_t>(params_.maxCorners_)));

    for (auto &cell: cells)
    {
        if (cell.size() > maxPerCell)
        {
            std::nth_element(cell.begin(), cell.begin() + maxPerCell, cell.end(), [](const cv::KeyPoint &a, const cv::KeyPoint &b) {
                return a.response > b.response;
            });
            cell.resize(maxPerCell);
        }

        std::move(cell.begin(), cell.end(), std::back_inserter(result));
    }

    return result;
}
