#include <benchmark/benchmark.h>
#include <cadence/frame_store.hpp>
#include <cadence/playback.hpp>
#include <cadence/readiness.hpp>
#include <chrono>

// --- Frame store ---

static void BM_FrameStoreSet(benchmark::State& state)
{
    cadence::FrameStore store;
    const int           listeners = static_cast<int>(state.range(0));
    int64_t             sink      = 0;
    for (int i = 0; i < listeners; ++i)
        store.subscribe([&sink](cadence::Frame f) { sink += f; });

    cadence::Frame f = 0;
    for (auto _ : state)
    {
        store.set(++f);
        benchmark::DoNotOptimize(sink);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_FrameStoreSet)->Arg(0)->Arg(1)->Arg(16)->Arg(128);

static void BM_FrameStoreUnchangedSet(benchmark::State& state)
{
    cadence::FrameStore store(10);
    store.subscribe([](cadence::Frame) {});
    for (auto _ : state)
    {
        bool changed = store.set(10.4);
        benchmark::DoNotOptimize(changed);
    }
}
BENCHMARK(BM_FrameStoreUnchangedSet);

// --- Playback ---

static void BM_PlaybackTick(benchmark::State& state)
{
    cadence::FrameStore     store;
    cadence::PlaybackConfig cfg;
    cfg.await_render_ack = false;
    cadence::PlaybackScheduler playback(store, cfg);
    playback.play();

    auto now = cadence::PlaybackScheduler::Clock::now();
    for (auto _ : state)
    {
        now += std::chrono::microseconds(16667);
        playback.tick(now);
    }
    cadence::Frame last = store.get();
    benchmark::DoNotOptimize(last);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PlaybackTick);

// --- Readiness ---

static void BM_BarrierStartFinish(benchmark::State& state)
{
    cadence::ReadinessBarrier barrier("image");
    for (auto _ : state)
    {
        auto finish = barrier.start();
        finish();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_BarrierStartFinish);

static void BM_AwaitIdleFrame(benchmark::State& state)
{
    cadence::ReadinessRegistry registry;
    cadence::Frame             frame = 0;
    for (auto _ : state)
    {
        auto status = registry.await_frame_ready(frame++, nullptr, std::chrono::seconds(1));
        benchmark::DoNotOptimize(status);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AwaitIdleFrame);
