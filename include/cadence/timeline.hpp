#pragma once

#include <cadence/audio_plan.hpp>
#include <cadence/clip.hpp>
#include <cadence/clip_registry.hpp>
#include <cadence/frame_store.hpp>
#include <cadence/playback.hpp>
#include <cadence/project.hpp>
#include <cadence/scene_tree.hpp>
#include <cadence/visibility.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace cadence
{

/**
 * Timeline — root of one composition.
 *
 * Owns the frame store, the keyed stores scene nodes and media bindings
 * register into (clips, audio segments), the user's hidden-set, the scene
 * tree and the playback scheduler, which is wired to the project fps and to
 * duration_frames().
 */
class Timeline
{
   public:
    explicit Timeline(ProjectSettings settings = {});
    ~Timeline();

    Timeline(const Timeline&)            = delete;
    Timeline& operator=(const Timeline&) = delete;

    FrameStore&        frames() { return frames_; }
    ClipRegistry&      clips() { return clips_; }
    VisibilityState&   visibility() { return visibility_; }
    AudioPlan&         audio() { return audio_; }
    SceneTree&         scene() { return *scene_; }
    PlaybackScheduler& playback() { return *playback_; }

    const FrameStore&      frames() const { return frames_; }
    const ClipRegistry&    clips() const { return clips_; }
    const VisibilityState& visibility() const { return visibility_; }
    const AudioPlan&       audio() const { return audio_; }
    const SceneTree&       scene() const { return *scene_; }

    const ProjectSettings& settings() const { return settings_; }

    // Rejects invalid settings. A new fps is forwarded to playback.
    bool   set_settings(const ProjectSettings& settings);
    double fps() const { return settings_.fps; }

    Frame current_frame() const { return frames_.get(); }

    // max(1, furthest clip end + 1, current frame + 1)
    Frame duration_frames() const;

    // Registered, containing the current frame and effectively visible.
    bool                is_active(ClipId id) const;
    std::vector<ClipId> active_clips() const;

    // Lane packing of the current clip set, recomputed only when the
    // registry revision changes.
    std::vector<PlacedClip> layout() const;
    uint32_t                track_count() const;

    std::vector<WaveformSegment> waveform_segments(ClipId id) const;

   private:
    ProjectSettings settings_;

    FrameStore      frames_;
    ClipRegistry    clips_;
    VisibilityState visibility_;
    AudioPlan       audio_;

    std::unique_ptr<SceneTree>         scene_;
    std::unique_ptr<PlaybackScheduler> playback_;

    mutable std::mutex              layout_mutex_;
    mutable uint64_t                layout_revision_ = UINT64_MAX;
    mutable std::vector<PlacedClip> layout_;
};

}   // namespace cadence
