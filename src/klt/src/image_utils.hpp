#pragma once

#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

class ImageUtils
{
public:
    static cv::Mat toGray(const cv::Mat &image);

    static cv::Mat toColor(const cv::Mat &image);

    // 16-bit images are scaled by 1/256, other depths are stretched to [0, 255]
    static cv::Mat to8Bit(const cv::Mat &image);

    static cv::Mat gaussianBlur(const cv::Mat &image, int kernelSize = 3);

    // Jet colors (BGR) for values in [0, 1]
    static std::vector<cv::Scalar> colormap(const std::vector<float> &values);

    // Jet colors (BGR) for integer values, clamped to [0, 255]
    static std::vector<cv::Scalar> colormap(const std::vector<int> &values);

    // N evenly spaced jet colors
    static std::vector<cv::Scalar> colorWheel(int n);

    static bool finiteAndWithinBounds(const cv::Point2f &point, const cv::Size &size);
};
