#pragma once

#include "cpanbridge/Config.hpp"
#include "cpanbridge/core/HandlePool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cpanbridge {

struct CleanupEntry {
    std::string id;
    HandleKind kind{HandleKind::DatabaseConnection};
    std::chrono::milliseconds idle{0};
};

struct CleanupReport {
    std::size_t cleaned{0};
    std::size_t remaining{0};
    std::vector<CleanupEntry> details;
};

class StaleReaper {
public:
    StaleReaper(HandlePool& pool, const Config& config);
    ~StaleReaper();

    StaleReaper(const StaleReaper&) = delete;
    StaleReaper& operator=(const StaleReaper&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool running() const noexcept;

    // One synchronous sweep; also what the background loop runs every period.
    CleanupReport run_once();

    [[nodiscard]] std::chrono::seconds period() const noexcept { return period_; }
    [[nodiscard]] std::chrono::seconds threshold_for(HandleKind kind) const { return config_.idle_threshold_for(kind); }
    [[nodiscard]] std::uint64_t cycles() const noexcept;
    [[nodiscard]] std::uint64_t total_reaped() const noexcept;
    [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> last_cycle() const;

private:
    void loop();

    HandlePool& pool_;
    const Config& config_;
    std::chrono::seconds period_;
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> cycles_{0};
    std::atomic<std::uint64_t> total_reaped_{0};
    std::optional<std::chrono::steady_clock::time_point> last_cycle_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

}  // namespace cpanbridge
