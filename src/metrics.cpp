#include "nsclient/metrics.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace nsclient {

namespace {

const prometheus::Histogram::BucketBoundaries& request_buckets() {
    static const prometheus::Histogram::BucketBoundaries buckets{
        0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 300};
    return buckets;
}

}  // namespace

ClientMetrics::ClientMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    requests_family_ = &prometheus::BuildCounter()
        .Name("nsclient_requests_total")
        .Help("Total storage API requests")
        .Labels(labels)
        .Register(*registry_);

    request_duration_family_ = &prometheus::BuildHistogram()
        .Name("nsclient_request_duration_seconds")
        .Help("Storage API request duration in seconds")
        .Labels(labels)
        .Register(*registry_);

    conflicts_ = &prometheus::BuildCounter()
        .Name("nsclient_directory_conflicts_total")
        .Help("Directory creations answered with 409 (already exists)")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& creates_family = prometheus::BuildCounter()
        .Name("nsclient_creates_total")
        .Help("Total create operations (directories + upload)")
        .Labels(labels)
        .Register(*registry_);
    creates_success_ = &creates_family.Add({{"result", "success"}});
    creates_failure_ = &creates_family.Add({{"result", "failure"}});

    create_duration_ = &prometheus::BuildHistogram()
        .Name("nsclient_create_duration_seconds")
        .Help("Create operation duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, request_buckets());
}

void ClientMetrics::record_request(const std::string& action, bool success,
                                   std::chrono::steady_clock::duration elapsed) {
    requests_family_->Add({{"action", action}, {"result", success ? "success" : "failure"}})
        .Increment();
    request_duration_family_->Add({{"action", action}}, request_buckets())
        .Observe(std::chrono::duration<double>(elapsed).count());
}

std::string ClientMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool ClientMetrics::write_textfile(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    return !ec;
}

}  // namespace nsclient
