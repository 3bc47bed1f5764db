#pragma once

#include <atomic>
#include <memory>

namespace folio {

// Shared flag polled by a running load at its checkpoints.
// Cancelling never interrupts the step in progress.
class CancellationToken
{
public:
    void cancel() noexcept { _cancelled.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return _cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> _cancelled{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace folio
