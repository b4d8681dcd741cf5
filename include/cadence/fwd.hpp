#pragma once

#include <cstddef>
#include <cstdint>

namespace cadence
{

// Stable clip identity: the scene-tree arena index of the node that registered it.
using ClipId = uint64_t;

inline constexpr ClipId INVALID_CLIP_ID = static_cast<ClipId>(-1);

struct ClipInfo;
struct ClipInterval;
struct ClipSpec;
struct PlacedClip;
struct ProjectSettings;
struct TimeContext;

class FrameStore;
class ClipRegistry;
class SceneTree;
class VisibilityState;
class Timeline;

class PlaybackScheduler;
class PerfMonitor;

class ReadinessBarrier;
class ReadinessRegistry;
class PendingScope;

struct AudioSegment;
class AudioPlan;
class MediaMetaCache;
class MediaMetaSource;
class MediaFrameSource;
class MediaBinding;

class CaptureSession;

}   // namespace cadence
