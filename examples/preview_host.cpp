#include <cadence/cadence.hpp>
#include <cstdio>

#include "ui/preview_host.hpp"

int main()
{
    cadence::Logger::instance().configure_from_env();

    cadence::Timeline timeline({.name = "preview", .width = 1280, .height = 720, .fps = 60.0});
    auto&             scene = timeline.scene();

    auto root = scene.add_clip(cadence::SceneTree::kRoot, {0, 239, "scene"});
    scene.add_clip(root, {0, 59, "fade-in"});
    scene.add_clip(root, {30, 179, "body"});
    scene.add_serial(root, {{180, 209, "outro-a"}, {0, 29, "outro-b"}});
    scene.enter_all();

    cadence::PreviewHost host(timeline);
    if (!host.init(1280, 720, timeline.settings().name))
        return 1;

    host.set_render_callback(
        [&](cadence::Frame frame)
        {
            for (auto id : timeline.active_clips())
            {
                auto clip = timeline.clips().get(id);
                if (clip && frame == clip->start)
                    CADENCE_LOG_INFO("host", "enter '{}' at {}", clip->label, frame);
            }
        });

    std::printf("Space play/pause, Left/Right step, Home/End jump, L loop\n");
    host.run();
    return 0;
}
