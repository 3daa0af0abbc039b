#include "nsclient/client.hpp"
#include "nsclient/constants.hpp"
#include "nsclient/log.hpp"
#include "nsclient/metrics.hpp"
#include "nsclient/path_materializer.hpp"

#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <utility>

namespace nsclient {

// ============================================================================
// Date parsing for mtime
// ============================================================================

std::optional<std::chrono::system_clock::time_point> parse_date(const std::string& date) {
    if (date.empty()) return std::nullopt;

    // Decimal Unix seconds
    size_t digits_from = (date[0] == '-') ? 1 : 0;
    if (digits_from < date.size() &&
        date.find_first_not_of("0123456789", digits_from) == std::string::npos) {
        try {
            return std::chrono::system_clock::time_point(std::chrono::seconds(std::stoll(date)));
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    std::string text = date;
    if (text.back() == 'Z') text.pop_back();

    for (const char* format : {"%Y-%m-%dT%H:%M:%S", "%Y-%m-%d %H:%M:%S", "%Y-%m-%d"}) {
        std::tm tm = {};
        std::istringstream iss(text);
        iss >> std::get_time(&tm, format);
        if (iss.fail()) continue;
        // Reject trailing garbage
        if (iss.peek() != std::char_traits<char>::eof()) continue;

        std::tm parsed = tm;
        time_t t = timegm(&tm);

        // timegm normalizes out-of-range fields (Feb 31 -> Mar 2); reject those
        std::tm check = {};
        if (!gmtime_r(&t, &check) ||
            check.tm_year != parsed.tm_year || check.tm_mon != parsed.tm_mon ||
            check.tm_mday != parsed.tm_mday || check.tm_hour != parsed.tm_hour ||
            check.tm_min != parsed.tm_min || check.tm_sec != parsed.tm_sec) {
            return std::nullopt;
        }
        return std::chrono::system_clock::from_time_t(t);
    }
    return std::nullopt;
}

// ============================================================================
// NetStorageClient
// ============================================================================

NetStorageClient::NetStorageClient(ClientConfig config,
                                   std::shared_ptr<net::HttpTransport> transport,
                                   ClientMetrics* metrics)
    : NetStorageClient(config, RequestSigner(config), std::move(transport), metrics) {}

NetStorageClient::NetStorageClient(ClientConfig config, RequestSigner signer,
                                   std::shared_ptr<net::HttpTransport> transport,
                                   ClientMetrics* metrics)
    : config_(std::move(config))
    , builder_(config_, std::move(signer))
    , transport_(transport ? std::move(transport) : std::make_shared<net::CurlTransport>())
    , metrics_(metrics) {}

ActionResult NetStorageClient::execute(Action action, const std::string& path,
                                       const RequestParams& params) const {
    net::HttpRequest request = builder_.build(path, params);

    if (config_.verbose) {
        log_debug("%s %s action=%s", net::http_method_to_string(request.method),
                  request.url.c_str(), action_name(action));
    }

    auto start = std::chrono::steady_clock::now();
    net::HttpResponse response = transport_->execute(request);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ActionResult result = builder_.classify(response);

    if (config_.verbose) {
        log_debug("%s %s -> %d (%lld ms)", action_name(action), path.c_str(),
                  response.status_code,
                  static_cast<long long>(
                      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count()));
    }
    if (metrics_) {
        metrics_->record_request(action_name(action), result.success, elapsed);
    }
    return result;
}

ActionResult NetStorageClient::simple(Action action, const std::string& path,
                                      net::HttpMethod method) const {
    return execute(action, path, RequestParams::for_action(action, method));
}

ActionResult NetStorageClient::stat(const std::string& path) const {
    return simple(Action::Stat, path, net::HttpMethod::GET);
}

ActionResult NetStorageClient::du(const std::string& path) const {
    return simple(Action::Du, path, net::HttpMethod::GET);
}

ActionResult NetStorageClient::dir(const std::string& path) const {
    return simple(Action::Dir, path, net::HttpMethod::GET);
}

ActionResult NetStorageClient::download(const std::string& path, std::ostream& out) const {
    auto params = RequestParams::for_action(Action::Download);
    params.response_sink = &out;
    return execute(Action::Download, path, params);
}

ActionResult NetStorageClient::remove(const std::string& path) const {
    return simple(Action::Delete, path, net::HttpMethod::PUT);
}

ActionResult NetStorageClient::mkdir(const std::string& path) const {
    return simple(Action::Mkdir, path, net::HttpMethod::PUT);
}

ActionResult NetStorageClient::rmdir(const std::string& path) const {
    return simple(Action::Rmdir, path, net::HttpMethod::PUT);
}

ActionResult NetStorageClient::rename(const std::string& from, const std::string& to) const {
    auto params = RequestParams::for_action(Action::Rename, net::HttpMethod::PUT);
    params.action_fields.set("destination", to);
    return execute(Action::Rename, from, params);
}

ActionResult NetStorageClient::symlink(const std::string& target,
                                       const std::string& link_path) const {
    auto params = RequestParams::for_action(Action::Symlink, net::HttpMethod::PUT);
    params.action_fields.set("target", target);
    return execute(Action::Symlink, link_path, params);
}

ActionResult NetStorageClient::mtime(const std::string& path,
                                     std::chrono::system_clock::time_point time) const {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        time.time_since_epoch()).count();

    auto params = RequestParams::for_action(Action::Mtime, net::HttpMethod::PUT);
    params.action_fields.set("mtime", std::to_string(seconds));
    return execute(Action::Mtime, path, params);
}

ActionResult NetStorageClient::mtime(const std::string& path, const std::string& date) const {
    auto time = parse_date(date);
    if (!time) {
        ActionResult result;
        result.error = Error::validation("The date has to be a valid date, got \"" + date + "\"");
        return result;
    }
    return mtime(path, *time);
}

ActionResult NetStorageClient::upload(net::UploadSource& source, const std::string& path) const {
    auto params = RequestParams::for_action(Action::Upload, net::HttpMethod::PUT);
    params.action_fields.set("upload-type", "binary");
    params.body = &source;
    return execute(Action::Upload, path, params);
}

ExistsResult NetStorageClient::file_exists(const std::string& path) const {
    ExistsResult exists;
    ActionResult result = stat(path);

    if (!result.success) {
        if (result.error.kind == ErrorKind::Protocol &&
            result.error.status == constants::STATUS_NOT_FOUND) {
            exists.success = true;
            exists.exists = false;
            return exists;
        }
        exists.error = std::move(result.error);
        return exists;
    }

    exists.success = true;
    const auto& data = result.data;
    exists.exists = data.is_object() && data.contains("stat") &&
                    data["stat"].is_object() && data["stat"].contains("file") &&
                    data["stat"]["file"].is_array() && !data["stat"]["file"].empty();
    return exists;
}

Status NetStorageClient::create(net::UploadSource& source, const std::string& base_prefix,
                                const std::string& target_path) const {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->create_duration());

    auto finish = [this](Status status) {
        if (metrics_) metrics_->record_create(status.success);
        return status;
    };

    std::string target = join_target(base_prefix, target_path);
    if (target == join_target(base_prefix, "")) {
        return finish(Status::fail(Error::validation("target path is empty")));
    }

    std::string diagnostics = config_.to_diagnostic_json().dump();

    // Step 1: ancestors, parent before child
    PathMaterializer materializer(
        [this](const std::string& directory) {
            ActionResult result = mkdir(directory);
            if (metrics_ && !result.success &&
                result.error.kind == ErrorKind::Protocol &&
                result.error.status == constants::STATUS_ALREADY_EXISTS) {
                metrics_->record_conflict();
            }
            return result;
        },
        diagnostics);

    Status status = materializer.ensure_chain(directory_chain(target));
    if (!status.success) {
        return finish(std::move(status));
    }

    // Step 2: a single upload attempt
    ActionResult uploaded = upload(source, target);
    if (!uploaded.success) {
        Error error = std::move(uploaded.error);
        error.message = "upload " + target + ": " + error.message + "\t" + diagnostics;
        return finish(Status::fail(std::move(error)));
    }

    return finish(Status::ok());
}

Status NetStorageClient::create(std::span<const uint8_t> payload, const std::string& base_prefix,
                                const std::string& target_path) const {
    net::PayloadSource source(payload);
    return create(source, base_prefix, target_path);
}

Status NetStorageClient::create(std::istream& in, const std::string& base_prefix,
                                const std::string& target_path) const {
    net::StreamSource source(in);
    return create(source, base_prefix, target_path);
}

std::future<Status> NetStorageClient::create_async(std::shared_ptr<net::UploadSource> source,
                                                   std::string base_prefix,
                                                   std::string target_path) const {
    if (!source) {
        std::promise<Status> rejected;
        rejected.set_value(Status::fail(Error::validation("upload source is null")));
        return rejected.get_future();
    }

    return std::async(std::launch::async,
                      [this, source = std::move(source), base = std::move(base_prefix),
                       target = std::move(target_path)]() {
                          return create(*source, base, target);
                      });
}

}  // namespace nsclient
