#pragma once

#include <iostream>
#include <string>
#include <opencv2/core.hpp>

/*
   Values                       FAST:       AVERAGE:        ACCURATE:
   ----------------------------------------------------------------------------
   gridCols x gridRows:         8 x 6       12 x 10         16 x 12
   maxCorners:                  600         1200            2000
   tracker winSize_:            15          21              31
   tracker fbCheck_:            false       true            true
   ----------------------------------------------------------------------------
*/

enum class DetectionMethod
{
    Fast,
    Gftt
};

DetectionMethod detectionMethodFromString(const std::string &name);

std::string detectionMethodToString(DetectionMethod method);

struct DetectorParams
{
    DetectionMethod method_ = DetectionMethod::Fast;

    // Bucketing grid (columns x rows)
    int gridCols_ = 12;
    int gridRows_ = 10;

    int maxCorners_ = 1200;
    int maxLevels_ = 4;
    bool subpixel_ = false;

    // FAST parameters
    int fastThreshold_ = 20;
    bool fastNonMaxSuppression_ = true;

    // Good-features-to-track parameters
    double gfttQuality_ = 0.04;
    double gfttMinDistance_ = 5.0;

    void validate() const;
};

struct TrackerParams
{
    int winSize_ = 21;
    int maxLevel_ = 4;

    // Convergence criteria
    int maxIterations_ = 10;
    double epsilon_ = 0.03;

    // Reject points with a LK error above this value, disabled when <= 0
    float maxError_ = 30.0;

    // Forward-backward check
    bool fbCheck_ = true;
    float maxFbDistance_ = 1.0;

    cv::TermCriteria termCriteria() const
    {
        return cv::TermCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS, maxIterations_, epsilon_);
    }

    void validate() const;
};

class KltParams
{

public:
    // Overrides the defaults with every key present in the YAML file
    static KltParams fromYaml(const std::string &filename);

    void validate() const;

    void print(std::ostream &os) const;

    DetectorParams detector_;
    TrackerParams tracker_;

    size_t maxTrackLength_ = 20;
    size_t minTracks_ = 1200;

    // Radius of the exclusion disk drawn around tracked points
    int maskRadius_ = 9;

    bool debug_ = false;
};
