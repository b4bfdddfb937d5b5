#include "lxid/vanity/progress_monitor.hpp"
#include "lxid/core/constants.hpp"
#include <algorithm>
#include <format>
namespace lxid::vanity {
    ProgressMonitor::ProgressMonitor(
        const std::atomic<uint64_t>& counter,
        const std::chrono::milliseconds interval,
        Sink sink)
        : counter_(counter)
        , interval_(interval)
        , sink_(std::move(sink)) {
    }

    ProgressMonitor::~ProgressMonitor() {
        Stop();
    }

    void ProgressMonitor::Start() {
        if (thread_.joinable()) {
            return;
        }
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = false;
        }
        thread_ = std::thread(&ProgressMonitor::Run, this);
    }

    void ProgressMonitor::Stop() {
        {
            std::lock_guard lock(mutex_);
            stop_requested_ = true;
        }
        stop_signal_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void ProgressMonitor::Run() {
        using Clock = std::chrono::steady_clock;
        const auto start = Clock::now();
        uint64_t last_total = counter_.load(std::memory_order_relaxed);

        std::unique_lock lock(mutex_);
        while (!stop_signal_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            const uint64_t total = counter_.load(std::memory_order_relaxed);
            const auto interval_ms = static_cast<uint64_t>(std::max<int64_t>(1, interval_.count()));
            const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - start).count();

            ProgressSample sample;
            sample.total = total;
            sample.rate = (total - last_total) * 1000 / interval_ms;
            sample.average_rate = elapsed_ms > 0
                ? static_cast<uint64_t>(static_cast<double>(total) * 1000.0 / static_cast<double>(elapsed_ms))
                : 0;
            last_total = total;

            lock.unlock();
            if (sink_) {
                sink_(sample);
            }
            lock.lock();
        }
    }

    std::string ProgressMonitor::FormatCount(const uint64_t count) {
        if (count >= VanityConstants::MILLION) {
            return std::format("{:.2f}M", static_cast<double>(count) / VanityConstants::MILLION);
        }
        if (count >= VanityConstants::THOUSAND) {
            return std::format("{:.2f}K", static_cast<double>(count) / VanityConstants::THOUSAND);
        }
        return std::format("{}", count);
    }

    std::string ProgressMonitor::FormatSample(const ProgressSample& sample) {
        return std::format("\r  Speed: {}/s (avg: {}/s) | Total: {}        ",
            FormatCount(sample.rate),
            FormatCount(sample.average_rate),
            FormatCount(sample.total));
    }
}
