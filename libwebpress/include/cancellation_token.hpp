//
// Created by Giuseppe Francione on 15/01/26.
//

#ifndef WEBPRESS_CANCELLATION_TOKEN_HPP
#define WEBPRESS_CANCELLATION_TOKEN_HPP

#include <atomic>

namespace webpress {

/**
 * @brief Set-once stop request shared between a run and its caller.
 *
 * request() is safe to call from any thread and from signal handlers.
 * Once set, the flag stays set for the rest of the run.
 */
class CancellationToken {
public:
    void request() noexcept {
        flag_.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_requested() const noexcept {
        return flag_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> flag_{false};
};

} // namespace webpress

#endif // WEBPRESS_CANCELLATION_TOKEN_HPP
