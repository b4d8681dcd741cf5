#include <cadence/logger.hpp>
#include <cadence/readiness.hpp>

namespace cadence
{

ReadinessRegistry::ReadinessRegistry()
{
    for (const char* category : {kGpu, kImage, kText, kMedia})
        barriers_.emplace(category, std::make_unique<ReadinessBarrier>(category));
}

ReadinessRegistry::~ReadinessRegistry() = default;

ReadinessRegistry& ReadinessRegistry::instance()
{
    static ReadinessRegistry registry;
    return registry;
}

ReadinessBarrier& ReadinessRegistry::barrier(const std::string& category)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = barriers_.find(category);
    if (it == barriers_.end())
    {
        CADENCE_LOG_DEBUG("readiness", "new barrier category '{}'", category);
        it = barriers_.emplace(category, std::make_unique<ReadinessBarrier>(category)).first;
    }
    return *it->second;
}

std::vector<std::string> ReadinessRegistry::categories() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(barriers_.size());
    for (const auto& [name, barrier] : barriers_)
        names.push_back(name);
    return names;
}

uint64_t ReadinessRegistry::total_pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (const auto& [name, barrier] : barriers_)
        total += barrier->pending();
    return total;
}

void ReadinessRegistry::register_frame_waiter(const std::string& id, FrameWaiter waiter)
{
    if (!waiter)
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_[id] = std::move(waiter);
}

void ReadinessRegistry::unregister_frame_waiter(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_.erase(id);
}

size_t ReadinessRegistry::frame_waiter_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return waiters_.size();
}

std::vector<ReadinessBarrier*> ReadinessRegistry::snapshot_barriers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReadinessBarrier*> out;
    out.reserve(barriers_.size());
    for (const auto& [name, barrier] : barriers_)
        out.push_back(barrier.get());
    return out;
}

ReadyStatus ReadinessRegistry::settle(const HostTick& host_tick, TimePoint deadline)
{
    while (true)
    {
        auto barriers = snapshot_barriers();
        for (auto* b : barriers)
        {
            if (!b->wait_until(deadline))
                return {false, b->category()};
        }

        if (host_tick)
            host_tick();

        const ReadinessBarrier* busy = nullptr;
        for (auto* b : snapshot_barriers())
        {
            if (b->pending() > 0)
            {
                busy = b;
                break;
            }
        }
        if (!busy)
            return {true, {}};
        if (Clock::now() >= deadline)
            return {false, busy->category()};
    }
}

ReadyStatus ReadinessRegistry::await_frame_ready(Frame                frame,
                                                 const HostTick&      host_tick,
                                                 Clock::duration      timeout)
{
    const TimePoint deadline = Clock::now() + timeout;

    ReadyStatus status = settle(host_tick, deadline);
    if (!status)
        return status;

    std::vector<std::pair<std::string, FrameWaiter>> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waiters.assign(waiters_.begin(), waiters_.end());
    }
    for (auto& [id, waiter] : waiters)
    {
        if (!waiter(frame, deadline))
        {
            CADENCE_LOG_DEBUG("readiness", "frame waiter '{}' did not present frame {}", id,
                              frame);
            return {false, "waiter:" + id};
        }
    }

    if (total_pending() == 0)
        return {true, {}};
    return settle(host_tick, deadline);
}

}   // namespace cadence
