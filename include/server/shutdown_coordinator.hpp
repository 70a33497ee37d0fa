#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sqlgateway {

/**
 * @brief Tracks in-flight requests so shutdown can drain them
 */
class ShutdownCoordinator {
public:
    struct Config {
        std::chrono::milliseconds shutdown_timeout{30000};
    };

    /**
     * @brief Holds one in-flight slot for the lifetime of a request
     *
     * admitted() is false when shutdown had already begun; the request must
     * then be answered with 503 without doing any work.
     */
    class RequestGuard {
    public:
        explicit RequestGuard(ShutdownCoordinator* coordinator)
            : coordinator_(coordinator),
              admitted_(coordinator == nullptr || coordinator->try_enter_request()) {}

        ~RequestGuard() {
            if (coordinator_ && admitted_) coordinator_->leave_request();
        }

        RequestGuard(const RequestGuard&) = delete;
        RequestGuard& operator=(const RequestGuard&) = delete;

        [[nodiscard]] bool admitted() const { return admitted_; }

    private:
        ShutdownCoordinator* coordinator_;
        bool admitted_;
    };

    ShutdownCoordinator();
    explicit ShutdownCoordinator(const Config& config);

    /// Called by signal handler to initiate shutdown
    void initiate_shutdown();

    /// Called at start of each request. Returns false if shutting down.
    [[nodiscard]] bool try_enter_request();

    /// Called when request completes.
    void leave_request();

    /// Blocks until all in-flight requests complete or timeout.
    /// Returns true if drained cleanly, false if timed out.
    [[nodiscard]] bool wait_for_drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint32_t in_flight_count() const {
        return in_flight_.load(std::memory_order_relaxed);
    }

private:
    Config config_;
    std::atomic<bool> shutting_down_{false};
    std::atomic<uint32_t> in_flight_{0};
    std::mutex drain_mutex_;
    std::condition_variable drain_cv_;
};

} // namespace sqlgateway
