#include "cpanbridge/core/StaleReaper.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <exception>

namespace cpanbridge {

using daemon::StructuredLogger;
using daemon::log_event;

StaleReaper::StaleReaper(HandlePool& pool, const Config& config)
    : pool_(pool), config_(config), period_(config.reaper_period) {}

StaleReaper::~StaleReaper() {
    stop();
}

void StaleReaper::start() {
    std::scoped_lock lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&StaleReaper::loop, this);
}

void StaleReaper::stop() {
    {
        std::scoped_lock lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        running_.store(false, std::memory_order_release);
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StaleReaper::running() const noexcept {
    return running_.load(std::memory_order_acquire);
}

CleanupReport StaleReaper::run_once() {
    CleanupReport report;
    for (const auto& entry : pool_.snapshot()) {
        const auto threshold = std::chrono::duration_cast<std::chrono::milliseconds>(config_.idle_threshold_for(entry.kind));
        if (entry.idle <= threshold) {
            continue;
        }
        // Re-checked under the pool lock so a concurrent touch wins. Children
        // dropped by the cascade are reported alongside their parent.
        const auto now = Handle::Clock::now();
        for (const auto& handle : pool_.remove_if_idle(entry.id, threshold)) {
            const auto last_used = handle->last_used_at();
            const auto idle = last_used < now ? std::chrono::duration_cast<std::chrono::milliseconds>(now - last_used)
                                              : std::chrono::milliseconds(0);
            report.details.push_back({handle->id(), handle->kind(), idle});
        }
    }
    report.cleaned = report.details.size();
    report.remaining = pool_.size();

    cycles_.fetch_add(1, std::memory_order_relaxed);
    total_reaped_.fetch_add(report.cleaned, std::memory_order_relaxed);
    {
        std::scoped_lock lock(mutex_);
        last_cycle_ = std::chrono::steady_clock::now();
    }

    if (report.cleaned > 0) {
        log_event(StructuredLogger::Level::Info,
                  "reaper.cycle",
                  {{"cleaned", std::to_string(report.cleaned)},
                   {"remaining", std::to_string(report.remaining)}});
    }
    return report;
}

std::uint64_t StaleReaper::cycles() const noexcept {
    return cycles_.load(std::memory_order_relaxed);
}

std::uint64_t StaleReaper::total_reaped() const noexcept {
    return total_reaped_.load(std::memory_order_relaxed);
}

std::optional<std::chrono::steady_clock::time_point> StaleReaper::last_cycle() const {
    std::scoped_lock lock(mutex_);
    return last_cycle_;
}

void StaleReaper::loop() {
    std::unique_lock lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
        wake_.wait_for(lock, period_, [this] { return !running_.load(std::memory_order_acquire); });
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        lock.unlock();
        try {
            run_once();
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Error, "reaper.error", {{"message", ex.what()}});
        }
        lock.lock();
    }
}

}  // namespace cpanbridge
