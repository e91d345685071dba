#include "storekit/metrics.hpp"
#include "storekit/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace storekit {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    operations_family_ = &prometheus::BuildCounter()
        .Name("storekit_operations_total")
        .Help("Total storage operations by operation and result")
        .Labels(labels)
        .Register(*registry_);

    // Pre-register the common series so they export as zero
    for (const char* op : {"save", "fetch", "list"}) {
        operations(op, true);
        operations(op, false);
    }

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("storekit_upload_bytes_total")
        .Help("Total bytes uploaded to the object store")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    listed_entries_total_ = &prometheus::BuildCounter()
        .Name("storekit_listed_entries_total")
        .Help("Total entries returned by listings")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("storekit_upload_duration_seconds")
        .Help("Upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});

    list_duration_ = &prometheus::BuildHistogram()
        .Name("storekit_list_duration_seconds")
        .Help("Listing request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

prometheus::Counter& MetricsExporter::operations(const std::string& op, bool success) {
    // Family::Add returns the existing series for known labels
    return operations_family_->Add({{"op", op}, {"result", success ? "success" : "failure"}});
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
    if (!write_file()) {
        log_error("Failed to write metrics file: %s", prom_file_path_.c_str());
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        if (!write_file()) {
            log_error("Failed to write metrics file: %s", prom_file_path_.c_str());
        }
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace storekit
