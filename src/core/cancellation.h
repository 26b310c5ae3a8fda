#pragma once
#include <atomic>

// Cooperative cancellation flag shared between the signal handler, the
// orchestrator and the rate controller.
class CancellationToken {
public:
    void cancel() { flag_.store(true, std::memory_order_release); }
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};
