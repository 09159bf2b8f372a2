#ifndef LINGUACOACH_COMPOSER_SCHEDULER_H
#define LINGUACOACH_COMPOSER_SCHEDULER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace composer {

using TimerId = std::uint32_t;
constexpr TimerId kInvalidTimer = 0;

/**
 * Scheduler: single-threaded virtual clock with cancelable one-shot timers
 * and a deferred "after the current event" task queue.
 *
 * Time only moves when the host calls advanceTo()/advanceBy(). Each fired
 * timer counts as one event, so deferred tasks it posts run right after it.
 */
class Scheduler {
public:
    using Task = std::function<void()>;

    Scheduler() = default;

    // Non-copyable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * Schedule a task to fire once after delayMs of virtual time.
     * @return Timer id, never kInvalidTimer
     */
    TimerId schedule(double delayMs, Task task);

    /**
     * Cancel a pending timer.
     * @return True if the timer was still pending
     */
    bool cancel(TimerId id);

    bool isPending(TimerId id) const;

    /**
     * Queue a task to run on the next runDeferred() call.
     */
    void defer(Task task);

    /**
     * Run the deferred tasks queued before this call. Tasks queued while
     * running are kept for the next call.
     * @return Number of tasks run
     */
    std::size_t runDeferred();

    /**
     * Move the clock forward to nowMs, firing due timers in due order.
     * @return Number of timers fired
     */
    std::size_t advanceTo(double nowMs);
    std::size_t advanceBy(double deltaMs) { return advanceTo(nowMs_ + deltaMs); }

    /** Drop every pending timer and deferred task. */
    void cancelAll();

    double now() const noexcept { return nowMs_; }
    std::size_t pendingTimerCount() const noexcept { return timers_.size(); }
    std::size_t pendingDeferredCount() const noexcept { return deferred_.size(); }

private:
    struct Timer {
        TimerId id;
        double dueMs;
        std::uint64_t sequence;
        Task task;
    };

    std::vector<Timer> timers_;
    std::vector<Task> deferred_;
    double nowMs_ = 0.0;
    TimerId nextTimerId_ = 1;
    std::uint64_t nextSequence_ = 0;
};

/**
 * One outstanding timer per purpose: restart() replaces the pending one.
 */
class DebounceTimer {
public:
    explicit DebounceTimer(Scheduler& scheduler) : scheduler_(scheduler) {}
    ~DebounceTimer() { cancel(); }

    DebounceTimer(const DebounceTimer&) = delete;
    DebounceTimer& operator=(const DebounceTimer&) = delete;

    void restart(double delayMs, Scheduler::Task task);
    bool cancel();
    bool pending() const { return id_ != kInvalidTimer && scheduler_.isPending(id_); }

private:
    Scheduler& scheduler_;
    TimerId id_ = kInvalidTimer;
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_SCHEDULER_H
