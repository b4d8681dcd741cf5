#include "ui/preview_controls.hpp"

#include <cadence/logger.hpp>
#include <cadence/playback.hpp>

namespace cadence
{

const char* preview_action_name(PreviewAction action)
{
    switch (action)
    {
        case PreviewAction::None:
            return "none";
        case PreviewAction::TogglePlay:
            return "toggle_play";
        case PreviewAction::StepBack:
            return "step_back";
        case PreviewAction::StepForward:
            return "step_forward";
        case PreviewAction::JumpToStart:
            return "jump_to_start";
        case PreviewAction::JumpToEnd:
            return "jump_to_end";
        case PreviewAction::ToggleLoop:
            return "toggle_loop";
    }
    return "none";
}

bool apply_preview_action(PlaybackScheduler& playback, PreviewAction action)
{
    switch (action)
    {
        case PreviewAction::None:
            return false;
        case PreviewAction::TogglePlay:
            playback.toggle_play();
            break;
        case PreviewAction::StepBack:
            playback.step(-1);
            break;
        case PreviewAction::StepForward:
            playback.step(1);
            break;
        case PreviewAction::JumpToStart:
            playback.jump_to_start();
            break;
        case PreviewAction::JumpToEnd:
            playback.jump_to_end();
            break;
        case PreviewAction::ToggleLoop:
            playback.set_loop(!playback.loop());
            break;
    }
    CADENCE_LOG_DEBUG("host", "action {}", preview_action_name(action));
    return true;
}

std::string preview_title(const std::string& name,
                          Frame              frame,
                          Frame              duration,
                          bool               playing,
                          bool               loop)
{
    std::string title = name + "  " + std::to_string(frame) + " / " + std::to_string(duration);
    if (playing)
        title += "  [playing]";
    if (loop)
        title += "  [loop]";
    return title;
}

}   // namespace cadence
