#include "image_utils.hpp"
#include <algorithm>
#include <cmath>

cv::Mat ImageUtils::toGray(const cv::Mat &image)
{
    cv::Mat gray;

    switch (image.channels())
    {
        case 3:
            cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
            break;
        case 4:
            cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
            break;
        default:
            gray = image;
            break;
    }

    return gray;
}

cv::Mat ImageUtils::to8Bit(const cv::Mat &image)
{
    cv::Mat converted;

    switch (image.depth())
    {
        case CV_8U:
            converted = image;
            break;
        case CV_16U:
            image.convertTo(converted, CV_8U, 1. / 256.);
            break;
        default:
            cv::normalize(image, converted, 0., 255., cv::NORM_MINMAX, CV_8U);
            break;
    }

    return converted;
}

cv::Mat ImageUtils::toColor(const cv::Mat &image)
{
    cv::Mat color;

    if (image.channels() == 1)
    {
        cv::cvtColor(image, color, cv::COLOR_GRAY2BGR);
    }
    else
    {
        color = image.clone();
    }

    return color;
}

cv::Mat ImageUtils::gaussianBlur(const cv::Mat &image, int kernelSize)
{
    cv::Mat blurred;
    cv::GaussianBlur(image, blurred, cv::Size(kernelSize, kernelSize), 0.);
    return blurred;
}

std::vector<cv::Scalar> ImageUtils::colormap(const std::vector<float> &values)
{
    std::vector<int> indices;
    indices.reserve(values.size());

    for (float v: values)
    {
        indices.push_back(static_cast<int>(std::lround(std::min(std::max(v, 0.f), 1.f) * 255.f)));
    }

    return colormap(indices);
}

std::vector<cv::Scalar> ImageUtils::colormap(const std::vector<int> &values)
{
    std::vector<cv::Scalar> colors;

    if (values.empty())
    {
        return colors;
    }

    cv::Mat lut(1, static_cast<int>(values.size()), CV_8UC1);

    for (size_t i = 0; i < values.size(); i++)
    {
        lut.at<uchar>(0, static_cast<int>(i)) = cv::saturate_cast<uchar>(values[i]);
    }

    cv::Mat colored;
    cv::applyColorMap(lut, colored, cv::COLORMAP_JET);

    colors.reserve(values.size());
    for (int i = 0; i < colored.cols; i++)
    {
        const cv::Vec3b &c = colored.at<cv::Vec3b>(0, i);
        colors.emplace_back(c[0], c[1], c[2]);
    }

    return colors;
}

std::vector<cv::Scalar> ImageUtils::colorWheel(int n)
{
    std::vector<float> values(std::max(n, 0));

    for (int i = 0; i < n; i++)
    {
        values[i] = n > 1 ? static_cast<float>(i) / (n - 1) : 0.f;
    }

    return colormap(values);
}

bool ImageUtils::finiteAndWithinBounds(const cv::Point2f &point, const cv::Size &size)
{
    return std::isfinite(point.x) && std::isfinite(point.y) && point.x >= 0 && point.y >= 0 && point.x < size.width && point.y < size.height;
}
