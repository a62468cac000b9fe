#pragma once

#include <atomic>

namespace cpact {

/**
 * \brief Cooperative cancellation flag shared by a run and every subprocess it spawns.
 *
 * cancel() only performs a lock-free atomic store, so it may be called from a signal handler.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace cpact
