#pragma once

#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <string>

namespace cadence
{

// Transport commands a preview host binds to keys.
enum class PreviewAction
{
    None,
    TogglePlay,
    StepBack,
    StepForward,
    JumpToStart,
    JumpToEnd,
    ToggleLoop,
};

const char* preview_action_name(PreviewAction action);

// Applies `action` to the scheduler. Returns false for PreviewAction::None.
bool apply_preview_action(PlaybackScheduler& playback, PreviewAction action);

// "<name>  frame / duration  [playing] [loop]"
std::string preview_title(const std::string& name,
                          Frame              frame,
                          Frame              duration,
                          bool               playing,
                          bool               loop);

}   // namespace cadence
