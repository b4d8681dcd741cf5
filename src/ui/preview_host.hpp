#pragma once

#ifdef CADENCE_USE_GLFW

    #include <cadence/frame.hpp>
    #include <cadence/readiness.hpp>
    #include <cstdint>
    #include <functional>
    #include <string>

    #include "ui/preview_controls.hpp"

struct GLFWwindow;

namespace cadence
{

class Timeline;

// PreviewHost — GLFW window that owns the per-frame animation callback of an
// interactive preview.
//
// Each host tick polls events, ticks the playback scheduler with the wall
// clock, calls the render callback for the current frame and acknowledges it
// as rendered. Keys: Space play/pause, Left/Right step, Home/End jump,
// L loop toggle.
class PreviewHost
{
   public:
    using RenderCallback = std::function<void(Frame frame)>;

    explicit PreviewHost(Timeline& timeline);
    ~PreviewHost();

    PreviewHost(const PreviewHost&)            = delete;
    PreviewHost& operator=(const PreviewHost&) = delete;

    // Initialize GLFW and create a window without a client API.
    bool init(uint32_t width, uint32_t height, const std::string& title);
    void shutdown();

    void set_render_callback(RenderCallback cb) { render_cb_ = std::move(cb); }

    // One host tick. Returns false once the window should close.
    bool tick();

    // Ticks until the window closes.
    void run();

    // tick() as a readiness host tick for capture from the same window.
    HostTick host_tick();

    bool should_close() const;

    static PreviewAction action_for_key(int key);

   private:
    static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);

    void update_title();

    Timeline&      timeline_;
    GLFWwindow*    window_ = nullptr;
    RenderCallback render_cb_;
    std::string    title_;
    std::string    shown_title_;
};

}   // namespace cadence

#endif   // CADENCE_USE_GLFW
