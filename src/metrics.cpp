#include "davdrive/driver/metrics.hpp"
#include "davdrive/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace davdrive {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    operations_family_ = &prometheus::BuildCounter()
        .Name("davdrive_operations_total")
        .Help("Total driver operations by name and result")
        .Labels(labels)
        .Register(*registry_);

    chunk_bytes_total_ = &prometheus::BuildCounter()
        .Name("davdrive_chunk_bytes_total")
        .Help("Total bytes received through chunked uploads")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    duration_family_ = &prometheus::BuildHistogram()
        .Name("davdrive_operation_duration_seconds")
        .Help("Driver operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::record_operation(const std::string& op, bool success) {
    operations_family_->Add({{"op", op}, {"result", success ? "success" : "failure"}}).Increment();
}

prometheus::Histogram& MetricsExporter::operation_duration(const std::string& op) {
    return duration_family_->Add({{"op", op}}, prometheus::Histogram::BucketBoundaries{
        0.001, 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void MetricsExporter::writer_loop() {
    std::unique_lock lock(cv_mutex_);
    while (!cv_.wait_for(lock, write_interval_, [this] { return !running_; })) {
        lock.unlock();
        write_file();
        lock.lock();
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    std::filesystem::path staging = prom_file_path_.string() + ".tmp";
    {
        std::ofstream out(staging, std::ios::trunc);
        out << serialize();
        out.flush();
        if (!out) {
            log_debug("Cannot write metrics snapshot %s", staging.c_str());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, prom_file_path_, ec);
    if (ec) {
        log_debug("Cannot publish metrics snapshot %s: %s",
                  prom_file_path_.c_str(), ec.message().c_str());
    }
}

}  // namespace davdrive
