#include <cadence/logger.hpp>
#include <cadence/readiness.hpp>

namespace cadence
{

ReadinessBarrier::ReadinessBarrier(std::string category)
    : category_(std::move(category)), state_(std::make_shared<State>())
{
}

ReadinessBarrier::~ReadinessBarrier()
{
    uint64_t left = state_->pending.load();
    if (left > 0)
        CADENCE_LOG_DEBUG("readiness", "barrier '{}' destroyed with {} pending", category_, left);
}

ReadinessBarrier::FinishFn ReadinessBarrier::start()
{
    state_->pending.fetch_add(1);
    CADENCE_LOG_TRACE("readiness", "'{}' start, pending {}", category_, state_->pending.load());

    auto done = std::make_shared<std::atomic<bool>>(false);
    return [state = state_, done]()
    {
        if (done->exchange(true))
            return;
        finish_one(*state);
    };
}

void ReadinessBarrier::finish_one(State& state)
{
    // Saturating decrement: the count never goes below zero.
    uint64_t current = state.pending.load();
    while (current > 0 && !state.pending.compare_exchange_weak(current, current - 1))
    {
    }
    if (current != 1)
        return;

    std::vector<ClearCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        ++state.clear_epoch;
        callbacks.swap(state.callbacks);
    }
    state.cv.notify_all();

    for (auto& cb : callbacks)
        cb();
}

uint64_t ReadinessBarrier::pending() const
{
    return state_->pending.load();
}

void ReadinessBarrier::wait()
{
    if (state_->pending.load() == 0)
        return;

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->pending.load() == 0)
        return;
    uint64_t epoch = state_->clear_epoch;
    state_->cv.wait(lock, [&] { return state_->clear_epoch != epoch; });
}

bool ReadinessBarrier::wait_for(Clock::duration timeout)
{
    return wait_until(Clock::now() + timeout);
}

bool ReadinessBarrier::wait_until(TimePoint deadline)
{
    if (state_->pending.load() == 0)
        return true;
    if (deadline == TimePoint::max())
    {
        wait();
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->pending.load() == 0)
        return true;
    uint64_t epoch = state_->clear_epoch;
    return state_->cv.wait_until(lock, deadline, [&] { return state_->clear_epoch != epoch; });
}

void ReadinessBarrier::on_clear(ClearCallback cb)
{
    if (!cb)
        return;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->pending.load() != 0)
        {
            state_->callbacks.push_back(std::move(cb));
            return;
        }
    }
    cb();
}

bool ReadinessBarrier::wait_ready(const HostTick& host_tick)
{
    return wait_ready_until(host_tick, TimePoint::max());
}

bool ReadinessBarrier::wait_ready(const HostTick& host_tick, Clock::duration timeout)
{
    return wait_ready_until(host_tick, Clock::now() + timeout);
}

bool ReadinessBarrier::wait_ready_until(const HostTick& host_tick, TimePoint deadline)
{
    while (true)
    {
        if (state_->pending.load() == 0)
        {
            if (host_tick)
                host_tick();
            if (state_->pending.load() == 0)
                return true;
        }
        if (deadline != TimePoint::max() && Clock::now() >= deadline)
            break;
        if (!wait_until(deadline))
            break;
    }

    CADENCE_LOG_DEBUG("readiness", "'{}' not ready by deadline, {} pending", category_,
                      state_->pending.load());
    return false;
}

}   // namespace cadence
