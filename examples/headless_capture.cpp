#include <cadence/cadence.hpp>
#include <chrono>
#include <cstdio>
#include <thread>
#include <vector>

// Stand-in for the decode service: every source is a 4 s clip at 30 fps.
class FixedMetaSource : public cadence::MediaMetaSource
{
   public:
    std::optional<cadence::MediaMeta> fetch(const std::string& /*path*/) override
    {
        return cadence::MediaMeta{.duration_ms = 4000.0,
                                  .fps         = 30.0,
                                  .frame_count = 120,
                                  .width       = 1280,
                                  .height      = 720};
    }
};

class InstantFrameSource : public cadence::MediaFrameSource
{
   public:
    bool present(const std::string& /*path*/, cadence::Frame /*source_frame*/, TimePoint /*deadline*/) override
    {
        return true;
    }
};

int main(int argc, char** argv)
{
    cadence::Logger::instance().configure_from_env();

    const std::string out_dir = argc > 1 ? argv[1] : "capture_out";

    cadence::Timeline timeline({.name = "headless", .width = 1280, .height = 720, .fps = 60.0});
    auto&             scene = timeline.scene();

    auto intro = scene.add_clip(cadence::SceneTree::kRoot, {0, 89, "intro"});
    scene.add_clip(intro, {15, 74, "title"});
    auto shots = scene.add_serial(cadence::SceneTree::kRoot,
                                  {{90, 149, "shot-a"}, {0, 44, "shot-b"}, {0, 29, "shot-c"}});
    scene.enter_all();

    FixedMetaSource    meta_source;
    InstantFrameSource frame_source;
    cadence::MediaMetaCache meta(meta_source);

    auto& readiness = cadence::ReadinessRegistry::instance();
    cadence::MediaBinding video({.id = "shot-a-video",
                                 .source = {"assets/shot_a.mp4", cadence::AudioSourceKind::Video},
                                 .trim = {.start = 30}},
                                {timeline.audio(), readiness, meta, &frame_source,
                                 &timeline.visibility(), timeline.fps()});
    video.mount(shots.front(), timeline.clips());

    for (const auto& placed : timeline.layout())
        std::printf("  track %u  [%4lld, %4lld]  %s\n", placed.track,
                    static_cast<long long>(placed.clip.start),
                    static_cast<long long>(placed.clip.end), placed.clip.label.c_str());

    // Every frame starts one image decode that settles on a worker thread.
    auto&                    images = readiness.barrier(cadence::ReadinessRegistry::kImage);
    std::vector<std::thread> workers;
    auto                     host_tick = [] { std::this_thread::sleep_for(std::chrono::milliseconds(1)); };

    cadence::CaptureSession session(timeline.frames(), readiness);
    session.set_on_progress(
        [](const cadence::CaptureProgress& p)
        {
            if (p.frames_done % 30 == 0)
                std::printf("  %llu/%llu frames (%.0f%%)\n",
                            static_cast<unsigned long long>(p.frames_done),
                            static_cast<unsigned long long>(p.total_frames), p.percent);
        });

    cadence::CaptureConfig config;
    config.start_frame   = 0;
    config.end_frame     = timeline.duration_frames() - 1;
    config.ready_timeout = std::chrono::milliseconds(2000);

    bool ok = session.begin(
        config,
        [&](cadence::Frame frame)
        {
            auto finish = images.start();
            workers.emplace_back(
                [finish]
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    finish();
                });
            return frame >= 0;
        },
        host_tick);
    ok = ok && session.run_all();

    for (auto& w : workers)
        w.join();

    if (!ok)
    {
        std::fprintf(stderr, "capture failed: %s\n", session.error().c_str());
        return 1;
    }

    cadence::write_audio_plan(out_dir + "/audio_plan.json", timeline.audio().segments(),
                              timeline.settings());
    std::printf("captured %llu frames\n",
                static_cast<unsigned long long>(session.total_frames()));
    return 0;
}
