#ifdef CADENCE_USE_GLFW

    #include "ui/preview_host.hpp"

    #include <cadence/logger.hpp>
    #include <cadence/timeline.hpp>
    #include <chrono>

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>

namespace cadence
{

PreviewHost::PreviewHost(Timeline& timeline) : timeline_(timeline) {}

PreviewHost::~PreviewHost()
{
    shutdown();
}

bool PreviewHost::init(uint32_t width, uint32_t height, const std::string& title)
{
    if (!glfwInit())
    {
        CADENCE_LOG_ERROR("host", "Failed to initialize GLFW");
        return false;
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);   // rendering belongs to the render callback
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    window_ = glfwCreateWindow(static_cast<int>(width), static_cast<int>(height), title.c_str(),
                               nullptr, nullptr);
    if (!window_)
    {
        CADENCE_LOG_ERROR("host", "Failed to create GLFW window");
        glfwTerminate();
        return false;
    }

    title_ = title;
    glfwSetWindowUserPointer(window_, this);
    glfwSetKeyCallback(window_, key_callback);

    CADENCE_LOG_INFO("host", "preview window {}x{} '{}'", width, height, title);
    return true;
}

void PreviewHost::shutdown()
{
    if (!window_)
        return;
    glfwDestroyWindow(window_);
    window_ = nullptr;
    glfwTerminate();
}

bool PreviewHost::tick()
{
    if (!window_)
        return false;

    glfwPollEvents();

    auto& playback = timeline_.playback();
    playback.tick(std::chrono::steady_clock::now());

    Frame frame = timeline_.current_frame();
    if (render_cb_)
        render_cb_(frame);
    playback.notify_rendered(frame);

    update_title();
    return !should_close();
}

void PreviewHost::run()
{
    while (tick())
    {
    }
}

HostTick PreviewHost::host_tick()
{
    return [this] { tick(); };
}

bool PreviewHost::should_close() const
{
    return window_ ? glfwWindowShouldClose(window_) : true;
}

PreviewAction PreviewHost::action_for_key(int key)
{
    switch (key)
    {
        case GLFW_KEY_SPACE:
            return PreviewAction::TogglePlay;
        case GLFW_KEY_LEFT:
            return PreviewAction::StepBack;
        case GLFW_KEY_RIGHT:
            return PreviewAction::StepForward;
        case GLFW_KEY_HOME:
            return PreviewAction::JumpToStart;
        case GLFW_KEY_END:
            return PreviewAction::JumpToEnd;
        case GLFW_KEY_L:
            return PreviewAction::ToggleLoop;
        default:
            return PreviewAction::None;
    }
}

void PreviewHost::key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    auto* self = static_cast<PreviewHost*>(glfwGetWindowUserPointer(window));
    if (!self || (action != GLFW_PRESS && action != GLFW_REPEAT))
        return;
    apply_preview_action(self->timeline_.playback(), action_for_key(key));
}

void PreviewHost::update_title()
{
    auto&       playback = timeline_.playback();
    std::string title    = preview_title(title_, timeline_.current_frame(),
                                         timeline_.duration_frames(), playback.is_playing(),
                                         playback.loop());
    if (title != shown_title_)
    {
        glfwSetWindowTitle(window_, title.c_str());
        shown_title_ = std::move(title);
    }
}

}   // namespace cadence

#endif   // CADENCE_USE_GLFW
