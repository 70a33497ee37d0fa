#pragma once

#include "config/config_loader.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sqlgateway {

/**
 * @brief Polls gateway.toml and hands every valid new version to a callback
 *
 * A change is detected by modification time. The file is re-parsed and
 * validated through ConfigLoader; a file that fails to load is logged and
 * the running configuration stays in place.
 *
 * The callback runs on the watcher thread. It swaps the registry snapshot,
 * reconciles the ConnectionManager and replaces the API key.
 */
class ConfigWatcher {
public:
    using ReloadCallback = std::function<void(const GatewayConfig& new_config)>;

    explicit ConfigWatcher(
        std::string config_path,
        std::chrono::seconds poll_interval = std::chrono::seconds{5});

    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    void set_callback(ReloadCallback callback);

    void start();
    void stop();

    /**
     * @brief Check the file once and reload if it changed
     * @return true when a new config was loaded and handed to the callback
     */
    bool poll_once();

    [[nodiscard]] bool is_running() const { return running_.load(); }

private:
    void watch_loop(std::stop_token stop);

    std::string config_path_;
    std::chrono::seconds poll_interval_;
    ReloadCallback callback_;

    std::mutex poll_mutex_;
    std::filesystem::file_time_type last_mtime_{};
    std::atomic<bool> running_{false};
    std::jthread watch_thread_;
};

} // namespace sqlgateway
