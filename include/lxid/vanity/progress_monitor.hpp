#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
namespace lxid::vanity {
struct ProgressSample {
    /// Attempts per second over the last interval.
    uint64_t rate = 0;
    /// Attempts per second since Start().
    uint64_t average_rate = 0;
    uint64_t total = 0;
};

/**
 * @brief Periodically samples a shared attempt counter on a background thread
 *
 * The sink runs on the monitor thread once per interval. Stop() wakes the
 * thread immediately and joins it; the destructor calls Stop().
 */
class ProgressMonitor {
public:
    using Sink = std::function<void(const ProgressSample&)>;

    ProgressMonitor(
        const std::atomic<uint64_t>& counter,
        std::chrono::milliseconds interval,
        Sink sink);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void Start();
    void Stop();

    /// "N" below one thousand, "N.NNK" below one million, otherwise "N.NNM".
    [[nodiscard]] static std::string FormatCount(uint64_t count);

    /// "\r  Speed: <rate>/s (avg: <avg>/s) | Total: <total>" padded for overwrite.
    [[nodiscard]] static std::string FormatSample(const ProgressSample& sample);
private:
    void Run();

    const std::atomic<uint64_t>& counter_;
    std::chrono::milliseconds interval_;
    Sink sink_;
    std::mutex mutex_;
    std::condition_variable stop_signal_;
    bool stop_requested_ = false;
    std::thread thread_;
};
}
