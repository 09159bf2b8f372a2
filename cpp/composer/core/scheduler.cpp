#include "composer/core/scheduler.h"

#include <algorithm>
#include <utility>

namespace composer {

TimerId Scheduler::schedule(double delayMs, Task task) {
    const TimerId id = nextTimerId_++;
    if (nextTimerId_ == kInvalidTimer) {
        nextTimerId_ = 1;
    }
    const double delay = delayMs > 0.0 ? delayMs : 0.0;
    timers_.push_back(Timer{id, nowMs_ + delay, nextSequence_++, std::move(task)});
    return id;
}

bool Scheduler::cancel(TimerId id) {
    if (id == kInvalidTimer) {
        return false;
    }
    auto it = std::find_if(timers_.begin(), timers_.end(), [id](const Timer& t) { return t.id == id; });
    if (it == timers_.end()) {
        return false;
    }
    timers_.erase(it);
    return true;
}

bool Scheduler::isPending(TimerId id) const {
    if (id == kInvalidTimer) {
        return false;
    }
    return std::any_of(timers_.begin(), timers_.end(), [id](const Timer& t) { return t.id == id; });
}

void Scheduler::defer(Task task) {
    deferred_.push_back(std::move(task));
}

std::size_t Scheduler::runDeferred() {
    std::vector<Task> batch;
    batch.swap(deferred_);
    for (Task& task : batch) {
        if (task) {
            task();
        }
    }
    return batch.size();
}

std::size_t Scheduler::advanceTo(double nowMs) {
    std::size_t fired = 0;
    while (true) {
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->dueMs > nowMs) continue;
            if (next == timers_.end()
                || it->dueMs < next->dueMs
                || (it->dueMs == next->dueMs && it->sequence < next->sequence)) {
                next = it;
            }
        }
        if (next == timers_.end()) {
            break;
        }

        Timer timer = std::move(*next);
        timers_.erase(next);
        if (timer.dueMs > nowMs_) {
            nowMs_ = timer.dueMs;
        }
        if (timer.task) {
            timer.task();
        }
        ++fired;
        runDeferred();
    }

    if (nowMs > nowMs_) {
        nowMs_ = nowMs;
    }
    return fired;
}

void Scheduler::cancelAll() {
    timers_.clear();
    deferred_.clear();
}

void DebounceTimer::restart(double delayMs, Scheduler::Task task) {
    cancel();
    id_ = scheduler_.schedule(delayMs, [this, task = std::move(task)]() {
        id_ = kInvalidTimer;
        task();
    });
}

bool DebounceTimer::cancel() {
    if (id_ == kInvalidTimer) {
        return false;
    }
    const bool wasPending = scheduler_.cancel(id_);
    id_ = kInvalidTimer;
    return wasPending;
}

} // namespace composer
