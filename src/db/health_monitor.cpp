#include "db/health_monitor.hpp"
#include "core/utils.hpp"
#include <format>

namespace sqlgateway {

HealthMonitor::HealthMonitor(std::shared_ptr<ConnectionManager> manager,
                             std::chrono::seconds interval)
    : manager_(std::move(manager)),
      interval_(interval) {}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.load() || interval_.count() <= 0) return;
    running_.store(true);
    monitor_thread_ = std::jthread([this](std::stop_token stop) {
        monitor_loop(std::move(stop));
    });
    utils::log::info(std::format("Health monitor started: probing every {}s", interval_.count()));
}

void HealthMonitor::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (monitor_thread_.joinable()) {
        monitor_thread_.request_stop();
        monitor_thread_.join();
    }
    utils::log::info("Health monitor stopped");
}

void HealthMonitor::monitor_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        for (int i = 0; i < interval_.count() * 10 && !stop.stop_requested(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        if (stop.stop_requested()) break;

        for (const auto& name : manager_->profile_names()) {
            if (stop.stop_requested()) break;
            const HealthStatus health = manager_->health_check(name);
            utils::log::debug(std::format("Health check '{}': connected={} healthy={}",
                name, health.connected, health.healthy));
        }
        rounds_.fetch_add(1);
    }
}

} // namespace sqlgateway
