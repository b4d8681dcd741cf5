#include <cadence/logger.hpp>
#include <cadence/media.hpp>
#include <cmath>
#include <exception>

namespace cadence
{

static MediaMeta sanitize_meta(const MediaMeta& in)
{
    MediaMeta out = in;
    if (!std::isfinite(out.duration_ms) || out.duration_ms < 0.0)
        out.duration_ms = 0.0;
    if (!std::isfinite(out.fps) || out.fps < 0.0)
        out.fps = 0.0;
    return out;
}

MediaMeta MediaMetaCache::query(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(path);
    if (it != cache_.end())
        return it->second;

    MediaMeta meta;
    try
    {
        if (auto fetched = source_.fetch(path))
            meta = sanitize_meta(*fetched);
        else
            CADENCE_LOG_ERROR("media", "failed to fetch metadata for '{}'", path);
    }
    catch (const std::exception& e)
    {
        CADENCE_LOG_ERROR("media", "failed to fetch metadata for '{}': {}", path, e.what());
        meta = MediaMeta{};
    }

    CADENCE_LOG_DEBUG("media", "'{}': {} frames @ {} fps, {} ms, {}x{}", path, meta.frame_count,
                      meta.fps, meta.duration_ms, meta.width, meta.height);
    cache_.emplace(path, meta);
    return meta;
}

bool MediaMetaCache::contains(const std::string& path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.count(path) > 0;
}

size_t MediaMetaCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void MediaMetaCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
}

Frame media_length_frames(const MediaMeta& meta, double project_fps)
{
    if (!(project_fps > 0.0) || !std::isfinite(project_fps))
        return 0;
    if (meta.frame_count > 0 && meta.fps > 0.0)
        return sanitize_frame(std::round(static_cast<double>(meta.frame_count) * project_fps / meta.fps));
    double secs = meta.duration_ms > 0.0 ? meta.duration_ms / 1000.0 : 0.0;
    return sanitize_frame(std::round(secs * project_fps));
}

}   // namespace cadence
