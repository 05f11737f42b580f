#include "engine/TorrentRegistry.hpp"

#include <algorithm>

namespace tmax::engine
{

bool TorrentRegistry::insert(TorrentHandlePtr handle)
{
    if (!handle || !handle->is_valid())
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto const &fingerprint = handle->fingerprint();
    if (fingerprint.empty() || handles_.contains(fingerprint))
    {
        return false;
    }
    order_.push_back(fingerprint);
    handles_.emplace(fingerprint, std::move(handle));
    return true;
}

TorrentHandlePtr TorrentRegistry::find(std::string const &fingerprint) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = handles_.find(fingerprint); it != handles_.end())
    {
        return it->second;
    }
    return nullptr;
}

TorrentHandlePtr TorrentRegistry::take(std::string const &fingerprint)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handles_.find(fingerprint);
    if (it == handles_.end())
    {
        return nullptr;
    }
    auto handle = std::move(it->second);
    handles_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), fingerprint),
                 order_.end());
    return handle;
}

bool TorrentRegistry::contains(std::string const &fingerprint) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.contains(fingerprint);
}

std::vector<TorrentHandlePtr> TorrentRegistry::handles() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TorrentHandlePtr> result;
    result.reserve(order_.size());
    for (auto const &fingerprint : order_)
    {
        if (auto it = handles_.find(fingerprint); it != handles_.end())
        {
            result.push_back(it->second);
        }
    }
    return result;
}

std::size_t TorrentRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

bool TorrentRegistry::empty() const
{
    return size() == 0;
}

void TorrentRegistry::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.clear();
    order_.clear();
}

} // namespace tmax::engine
