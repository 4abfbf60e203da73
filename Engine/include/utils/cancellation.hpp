#pragma once

#include <atomic>

namespace Repealer {

/**
 * @brief Cooperative cancellation flag shared between a caller and a long operation.
 *
 * Operations poll cancelled() at safe points (between ingestion batches) and stop there.
 */
class CancellationToken {
public:
    void cancel() { flag_.store(true, std::memory_order_release); }
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};

} // namespace Repealer
