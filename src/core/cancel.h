#pragma once

#include <atomic>
#include <chrono>
#include <optional>

// Core Cancel subsystem
// Responsible for: cooperative cancellation and deadlines for long-running searches.
// Should NOT do: own threads or schedule work.
namespace delve::core {

class CancelToken {
public:
    using Clock = std::chrono::steady_clock;

    CancelToken() = default;
    explicit CancelToken(Clock::duration timeout) : m_deadline(Clock::now() + timeout) {}

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        m_cancelled.store(true, std::memory_order_relaxed);
    }

    [[nodiscard]] bool cancelled() const {
        if (m_cancelled.load(std::memory_order_relaxed)) {
            return true;
        }
        return m_deadline.has_value() && Clock::now() >= *m_deadline;
    }

private:
    std::atomic<bool> m_cancelled{false};
    std::optional<Clock::time_point> m_deadline;
};

inline bool isCancelled(const CancelToken* token) {
    return token != nullptr && token->cancelled();
}

} // namespace delve::core
