#include "track_manager.hpp"
#include <cmath>
#include <iostream>
#include <unordered_set>

void Track::append(const cv::Point2f &point)
{
    items_.push_back(point);

    while (items_.size() > maxLength_)
    {
        items_.pop_front();
    }
}

TrackManager::TrackManager(size_t maxTrackLength)
        : maxTrackLength_(maxTrackLength == 0 ? 1 : maxTrackLength), nextId_(0)
{
}

void TrackManager::add(const std::vector<cv::Point2f> &points, const std::vector<int> &ids, bool prune)
{
    if (points.size() != ids.size())
    {
        if (debug_)
        {
            std::cout << "- [TrackManager]: Ignoring update with " << points.size() << " points and " << ids.size() << " ids" << std::endl;
        }
        return;
    }

    if (points.empty())
    {
        return;
    }

    std::unordered_set<int> updatedIds;
    updatedIds.reserve(ids.size());

    size_t numSkipped = 0;

    for (size_t i = 0; i < ids.size(); i++)
    {
        const cv::Point2f &point = points[i];

        if (!std::isfinite(point.x) || !std::isfinite(point.y))
        {
            numSkipped++;
            continue;
        }

        // Pruned or never allocated ids are not revived
        auto iterator = tracks_.find(ids[i]);

        if (iterator == tracks_.end())
        {
            numSkipped++;
            continue;
        }

        // Duplicated ids only count once
        if (!updatedIds.insert(ids[i]).second)
        {
            numSkipped++;
            continue;
        }

        iterator->second.append(point);
    }

    size_t numPruned = 0;

    if (prune)
    {
        for (auto it = tracks_.begin(); it != tracks_.end();)
        {
            if (updatedIds.count(it->first) == 0)
            {
                it = tracks_.erase(it);
                numPruned++;
            }
            else
            {
                ++it;
            }
        }
    }

    if (debug_)
    {
        std::cout << "- [TrackManager]: Updated " << updatedIds.size() << " tracks, skipped " << numSkipped << ", pruned " << numPruned << std::endl;
    }
}

void TrackManager::add(const std::vector<cv::Point2f> &points, bool prune)
{
    if (prune)
    {
        tracks_.clear();
    }

    for (const auto &point: points)
    {
        if (!std::isfinite(point.x) || !std::isfinite(point.y))
        {
            continue;
        }

        auto inserted = tracks_.emplace(nextId_++, Track(maxTrackLength_));
        inserted.first->second.append(point);
    }
}

std::vector<int> TrackManager::ids() const
{
    std::vector<int> result;
    result.reserve(tracks_.size());

    for (const auto &it: tracks_)
    {
        result.push_back(it.first);
    }

    return result;
}

std::vector<cv::Point2f> TrackManager::pts() const
{
    std::vector<cv::Point2f> result;
    result.reserve(tracks_.size());

    for (const auto &it: tracks_)
    {
        result.push_back(it.second.latestItem());
    }

    return result;
}

bool TrackManager::hasTrack(const int trackId) const
{
    return tracks_.find(trackId) != tracks_.end();
}

void TrackManager::clear()
{
    tracks_.clear();
}

