#pragma once

#include "hib/types.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace hib {

/// Observes the lifetime of the enclosing scope, in seconds, into a histogram.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& target) : target_(target) {}
    ~ScopedTimer() {
        using seconds = std::chrono::duration<double>;
        target_.Observe(seconds(std::chrono::steady_clock::now() - started_).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& target_;
    const std::chrono::steady_clock::time_point started_ = std::chrono::steady_clock::now();
};

/// Transfer counters kept in a prometheus-cpp registry and published as a
/// node_exporter textfile. Once started, a writer thread rewrites the file
/// every interval; stop() joins it and leaves a final snapshot behind.
class MetricsExporter {
public:
    MetricsExporter(std::filesystem::path prom_file, std::chrono::seconds interval,
                    const std::map<std::string, std::string>& const_labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    prometheus::Counter& transfers(Direction direction, Outcome outcome) {
        return *transfers_.at({direction, outcome});
    }
    prometheus::Counter& transfer_bytes(Direction direction) { return *bytes_.at(direction); }
    prometheus::Counter& retries_total() { return *retries_; }
    prometheus::Counter& skipped_total() { return *skipped_; }
    prometheus::Gauge& in_flight() { return *in_flight_; }
    prometheus::Histogram& transfer_duration() { return *duration_; }

    /// Serialize the registry to the textfile (tmp + rename).
    bool write_file();

private:
    std::filesystem::path prom_file_;
    std::chrono::seconds interval_;
    std::shared_ptr<prometheus::Registry> registry_;

    std::map<std::pair<Direction, Outcome>, prometheus::Counter*> transfers_;
    std::map<Direction, prometheus::Counter*> bytes_;
    prometheus::Counter* retries_ = nullptr;
    prometheus::Counter* skipped_ = nullptr;
    prometheus::Gauge* in_flight_ = nullptr;
    prometheus::Histogram* duration_ = nullptr;

    std::thread writer_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = true;
};

}  // namespace hib
