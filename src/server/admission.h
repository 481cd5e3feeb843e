#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace aiexec {

// Bounded pool of execution contexts with a bounded wait queue in front of it.
class ExecutionSlots {
public:
    // Returned by Acquire; gives the slot back when destroyed.
    class Slot {
    public:
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&&) = delete;
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot();

    private:
        friend class ExecutionSlots;
        explicit Slot(ExecutionSlots* owner) : owner_(owner) {}

        ExecutionSlots* owner_;
    };

    ExecutionSlots(int max_concurrency, int max_queue);

    // Takes a free slot, or waits up to `max_wait` in the queue for one. nullopt when the
    // queue is full or the wait expired.
    std::optional<Slot> Acquire(std::chrono::milliseconds max_wait);

    int active() const;
    int waiting() const;

private:
    void Release();

    mutable std::mutex mutex_;
    std::condition_variable released_;
    const int capacity_;
    const int max_queue_;
    int active_ = 0;
    int waiting_ = 0;
};

} // namespace aiexec
