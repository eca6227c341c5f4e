#pragma once

#include <atomic>

namespace codestorage::network {

/**
 * @brief Shared cancellation flag threaded through a request
 *
 * The HTTP client checks it before pulling each body piece and while any
 * socket operation is pending; once set the connection is closed and the
 * request fails. Safe to cancel from any thread.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true); }
    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace codestorage::network
