#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace nsclient {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Request metrics of one or more clients.
///
/// Owns a prometheus::Registry. All recording methods are thread safe and
/// may be shared by clients running concurrently.
class ClientMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit ClientMetrics(const std::map<std::string, std::string>& labels = {});

    ClientMetrics(const ClientMetrics&) = delete;
    ClientMetrics& operator=(const ClientMetrics&) = delete;

    /// One finished API request (result="success" or "failure").
    void record_request(const std::string& action, bool success,
                        std::chrono::steady_clock::duration elapsed);

    /// A 409 absorbed during directory creation.
    void record_conflict() { conflicts_->Increment(); }

    /// One finished create().
    void record_create(bool success) {
        (success ? creates_success_ : creates_failure_)->Increment();
    }

    prometheus::Histogram& create_duration() { return *create_duration_; }

    /// Text exposition format of the whole registry.
    std::string serialize() const;

    /// Write serialize() to path via temp file + rename.
    bool write_textfile(const std::filesystem::path& path) const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* requests_family_;
    prometheus::Family<prometheus::Histogram>* request_duration_family_;

    prometheus::Counter* conflicts_;
    prometheus::Counter* creates_success_;
    prometheus::Counter* creates_failure_;
    prometheus::Histogram* create_duration_;
};

}  // namespace nsclient
