#pragma once

#include <cadence/audio_export.hpp>
#include <cadence/audio_plan.hpp>
#include <cadence/capture.hpp>
#include <cadence/clip.hpp>
#include <cadence/clip_registry.hpp>
#include <cadence/frame.hpp>
#include <cadence/frame_store.hpp>
#include <cadence/fwd.hpp>
#include <cadence/lane_packer.hpp>
#include <cadence/logger.hpp>
#include <cadence/media.hpp>
#include <cadence/playback.hpp>
#include <cadence/project.hpp>
#include <cadence/readiness.hpp>
#include <cadence/scene_tree.hpp>
#include <cadence/timeline.hpp>
#include <cadence/trim.hpp>
#include <cadence/visibility.hpp>

// ─── Typical composition ─────────────────────────────────────────────────────
//
//   cadence::Timeline timeline({"demo", 1920, 1080, 60.0});
//   auto& scene = timeline.scene();
//   auto  intro = scene.add_clip(cadence::SceneTree::kRoot, {0, 119, "intro"});
//   scene.add_clip(intro, {10, 59, "title"});
//   scene.enter_all();
//
//   timeline.playback().play();
//   timeline.playback().tick(std::chrono::steady_clock::now());
