#include "src/server/admission.h"

namespace aiexec {

ExecutionSlots::Slot::~Slot() {
    if (owner_) {
        owner_->Release();
    }
}

ExecutionSlots::ExecutionSlots(int max_concurrency, int max_queue)
    : capacity_(max_concurrency), max_queue_(max_queue) {}

std::optional<ExecutionSlots::Slot> ExecutionSlots::Acquire(std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Newcomers do not overtake submissions that are already queued.
    if (active_ < capacity_ && waiting_ == 0) {
        ++active_;
        return Slot(this);
    }
    if (waiting_ >= max_queue_) {
        return std::nullopt;
    }

    ++waiting_;
    bool acquired = released_.wait_for(lock, max_wait, [this] { return active_ < capacity_; });
    --waiting_;
    if (!acquired) {
        return std::nullopt;
    }
    ++active_;
    return Slot(this);
}

int ExecutionSlots::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

int ExecutionSlots::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return waiting_;
}

void ExecutionSlots::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    released_.notify_one();
}

} // namespace aiexec
