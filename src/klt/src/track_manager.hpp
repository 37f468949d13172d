#pragma once

#include <deque>
#include <map>
#include <vector>
#include <opencv2/core.hpp>

// Bounded history of one tracked feature, most recent observation last
class Track
{

public:
    explicit Track(size_t maxLength) : maxLength_(maxLength)
    {}

    // Appends a point, evicting the oldest one once the history is full
    void append(const cv::Point2f &point);

    const std::deque<cv::Point2f> &items() const
    {
        return items_;
    }

    const cv::Point2f &latestItem() const
    {
        return items_.back();
    }

    size_t length() const
    {
        return items_.size();
    }

    size_t maxLength() const
    {
        return maxLength_;
    }

private:
    size_t maxLength_;
    std::deque<cv::Point2f> items_;
};

class TrackManager
{

public:
    explicit TrackManager(size_t maxTrackLength = 20);

    // Appends points to the tracks with the given ids. With prune set, every
    // track not listed in ids is removed. Mismatched or empty input is ignored.
    void add(const std::vector<cv::Point2f> &points, const std::vector<int> &ids, bool prune);

    // Creates one new track per point with freshly allocated ids
    void add(const std::vector<cv::Point2f> &points, bool prune = false);

    // Active ids in ascending order
    std::vector<int> ids() const;

    // Latest point of every active track, ordered like ids()
    std::vector<cv::Point2f> pts() const;

    const std::map<int, Track> &tracks() const
    {
        return tracks_;
    }

    bool hasTrack(const int trackId) const;

    size_t size() const
    {
        return tracks_.size();
    }

    bool empty() const
    {
        return tracks_.empty();
    }

    size_t maxTrackLength() const
    {
        return maxTrackLength_;
    }

    // Next id to be allocated
    int nextId() const
    {
        return nextId_;
    }

    // Removes every track, ids are still never reused
    void clear();

    bool debug_ = false;

private:
    size_t maxTrackLength_;
    int nextId_;

    std::map<int, Track> tracks_;
};
