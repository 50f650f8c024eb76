#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace davdrive {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports driver metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. After start(), a
/// background writer thread periodically serializes the registry to a .prom
/// file using atomic temp+rename; stop() writes one final snapshot.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file (empty: never written).
    /// @param write_interval  How often the writer thread writes the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels = {});
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Count one driver operation by name and outcome.
    void record_operation(const std::string& op, bool success);

    /// Duration histogram for one operation name.
    prometheus::Histogram& operation_duration(const std::string& op);

    prometheus::Counter& chunk_bytes_total() { return *chunk_bytes_total_; }

    /// Serialized registry in the Prometheus text format.
    std::string serialize() const;

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Families ---
    prometheus::Family<prometheus::Counter>* operations_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;

    // --- Counters ---
    prometheus::Counter* chunk_bytes_total_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace davdrive
