#pragma once

#include "db/connection_manager.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace sqlgateway {

/**
 * @brief Background checker keeping per-profile health current
 *
 * Every interval, runs ConnectionManager::health_check() for each managed
 * profile. Checks use the profile's dedicated health-check connection, so they
 * never wait behind queries. Sleeps in 100ms steps for prompt shutdown.
 */
class HealthMonitor {
public:
    HealthMonitor(std::shared_ptr<ConnectionManager> manager, std::chrono::seconds interval);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /** @brief Completed check rounds since start */
    [[nodiscard]] uint64_t rounds() const { return rounds_.load(); }

private:
    void monitor_loop(std::stop_token stop);

    std::shared_ptr<ConnectionManager> manager_;
    std::chrono::seconds interval_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> rounds_{0};
    std::jthread monitor_thread_;
};

} // namespace sqlgateway
