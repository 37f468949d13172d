#include "config.hpp"
#include <stdexcept>
#include <yaml-cpp/yaml.h>

DetectionMethod detectionMethodFromString(const std::string &name)
{
    if (name == "fast")
    {
        return DetectionMethod::Fast;
    }
    else if (name == "gftt")
    {
        return DetectionMethod::Gftt;
    }

    throw std::runtime_error("Unknown detection method " + name + ", use fast or gftt");
}

std::string detectionMethodToString(DetectionMethod method)
{
    return method == DetectionMethod::Fast ? "fast" : "gftt";
}

void DetectorParams::validate() const
{
    if (gridCols_ <= 0 || gridRows_ <= 0)
    {
        throw std::runtime_error("Detector grid must be positive");
    }

    if (maxCorners_ <= 0 || maxLevels_ <= 0)
    {
        throw std::runtime_error("Detector maxCorners and maxLevels must be positive");
    }
}

void TrackerParams::validate() const
{
    if (winSize_ < 3 || maxLevel_ < 0 || maxIterations_ <= 0)
    {
        throw std::runtime_error("Invalid optical-flow tracker parameters");
    }
}

void KltParams::validate() const
{
    detector_.validate();
    tracker_.validate();

    if (maxTrackLength_ == 0)
    {
        throw std::runtime_error("maxTrackLength must be at least 1");
    }

    if (maskRadius_ < 0)
    {
        throw std::runtime_error("maskRadius must not be negative");
    }
}

template<typename T>
static void readIfPresent(const YAML::Node &node, const char *key, T &value)
{
    if (node && node[key])
    {
        value = node[key].as<T>();
    }
}

KltParams KltParams::fromYaml(const std::string &filename)
{
    YAML::Node root;

    try
    {
        root = YAML::LoadFile(filename);
    }
    catch (const YAML::Exception &e)
    {
        throw std::runtime_error("Failed to load KLT config " + filename + ": " + e.what());
    }

    KltParams params;

    try
    {
        const YAML::Node detector = root["detector"];
        if (detector && detector["method"])
        {
            params.detector_.method_ = detectionMethodFromString(detector["method"].as<std::string>());
        }
        readIfPresent(detector, "grid_cols", params.detector_.gridCols_);
        readIfPresent(detector, "grid_rows", params.detector_.gridRows_);
        readIfPresent(detector, "max_corners", params.detector_.maxCorners_);
        readIfPresent(detector, "max_levels", params.detector_.maxLevels_);
        readIfPresent(detector, "subpixel", params.detector_.subpixel_);
        readIfPresent(detector, "fast_threshold", params.detector_.fastThreshold_);
        readIfPresent(detector, "fast_nonmax_suppression", params.detector_.fastNonMaxSuppression_);
        readIfPresent(detector, "gftt_quality", params.detector_.gfttQuality_);
        readIfPresent(detector, "gftt_min_distance", params.detector_.gfttMinDistance_);

        const YAML::Node tracker = root["tracker"];
        readIfPresent(tracker, "win_size", params.tracker_.winSize_);
        readIfPresent(tracker, "max_level", params.tracker_.maxLevel_);
        readIfPresent(tracker, "max_iterations", params.tracker_.maxIterations_);
        readIfPresent(tracker, "epsilon", params.tracker_.epsilon_);
        readIfPresent(tracker, "max_error", params.tracker_.maxError_);
        readIfPresent(tracker, "fb_check", params.tracker_.fbCheck_);
        readIfPresent(tracker, "max_fb_distance", params.tracker_.maxFbDistance_);

        readIfPresent(root, "max_track_length", params.maxTrackLength_);
        readIfPresent(root, "min_tracks", params.minTracks_);
        readIfPresent(root, "mask_radius", params.maskRadius_);
        readIfPresent(root, "debug", params.debug_);
    }
    catch (const YAML::Exception &e)
    {
        throw std::runtime_error("Malformed KLT config " + filename + ": " + e.what());
    }

    params.validate();

    return params;
}

void KltParams::print(std::ostream &os) const
{
    os << "- [KLT]: Configure";
    os << ": detector: " << detectionMethodToString(detector_.method_);
    os << ", grid: " << detector_.gridCols_ << "x" << detector_.gridRows_;
    os << ", max corners: " << detector_.maxCorners_;
    os << ", levels: " << detector_.maxLevels_;
    os << ", LK window: " << tracker_.winSize_;
    os << ", FB check: " << tracker_.fbCheck_;
    os << ", max track length: " << maxTrackLength_;
    os << ", min tracks: " << minTracks_ << std::endl;
}
