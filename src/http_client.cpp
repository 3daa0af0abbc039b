#include "nsclient/net/http.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace nsclient::net {

// ============================================================================
// Utility functions
// ============================================================================

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
    }
    return "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

std::string escape_url_path(const std::string& path) {
    static const char* unsafe = " \"<>\\^`{|}#?'%";
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (size_t i = 0; i < path.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(path[i]);
        bool keep = c > 0x20 && c < 0x7F && std::strchr(unsafe, c) == nullptr;
        // An existing %XX escape is passed through untouched
        if (c == '%' && i + 2 < path.size() &&
            std::isxdigit(static_cast<unsigned char>(path[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(path[i + 2]))) {
            keep = true;
        }
        if (keep) {
            escaped << static_cast<char>(c);
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return escaped.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {name, value};
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end()) {
        return it->second.second;
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

void HttpHeaders::merge(const HttpHeaders& other) {
    for (const auto& [key, pair] : other.headers_) {
        headers_[key] = pair;
    }
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    result.reserve(headers_.size());
    for (const auto& [key, pair] : headers_) {
        result.push_back(pair);
    }
    return result;
}

// ============================================================================
// Upload sources
// ============================================================================

PayloadSource::PayloadSource(std::span<const uint8_t> payload)
    : payload_(payload) {}

PayloadSource::PayloadSource(const std::string& payload)
    : payload_(reinterpret_cast<const uint8_t*>(payload.data()), payload.size()) {}

size_t PayloadSource::drain_into(uint8_t* dest, size_t capacity) {
    size_t remaining = payload_.size() - offset_;
    size_t to_copy = std::min(capacity, remaining);
    if (to_copy > 0) {
        std::memcpy(dest, payload_.data() + offset_, to_copy);
        offset_ += to_copy;
    }
    return to_copy;
}

OwnedPayloadSource::OwnedPayloadSource(std::string payload)
    : payload_(std::move(payload))
    , view_(payload_) {}

size_t OwnedPayloadSource::drain_into(uint8_t* dest, size_t capacity) {
    return view_.drain_into(dest, capacity);
}

StreamSource::StreamSource(std::istream& in, std::optional<uint64_t> size)
    : in_(in), size_(size) {}

size_t StreamSource::drain_into(uint8_t* dest, size_t capacity) {
    if (failed_ || !in_.good()) {
        if (in_.bad()) failed_ = true;
        return 0;
    }
    in_.read(reinterpret_cast<char*>(dest), static_cast<std::streamsize>(capacity));
    if (in_.bad()) {
        failed_ = true;
        return 0;
    }
    return static_cast<size_t>(in_.gcount());
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Context for bounded response accumulation
struct WriteCallbackContext {
    CURL* handle;
    std::string* buffer;
    std::ostream* sink;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
    bool sink_failed;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Only successful bodies go to the sink; error bodies are kept for diagnostics
    if (ctx->sink) {
        long status = 0;
        curl_easy_getinfo(ctx->handle, CURLINFO_RESPONSE_CODE, &status);
        if (is_success_status(static_cast<int>(status))) {
            ctx->sink->write(ptr, static_cast<std::streamsize>(bytes));
            if (!*ctx->sink) {
                ctx->sink_failed = true;
                return 0;
            }
            return bytes;
        }
    }

    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Abort transfer
    }

    ctx->buffer->append(ptr, bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty() || line.starts_with("HTTP/")) {
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        size_t start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? std::string() : value.substr(start);
        headers->set(name, value);
    }

    return bytes;
}

size_t read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* source = static_cast<UploadSource*>(userdata);
    size_t n = source->drain_into(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    if (n == 0 && source->failed()) {
        return CURL_READFUNC_ABORT;
    }
    return n;
}

} // namespace

// ============================================================================
// CurlTransport Implementation
// ============================================================================

class CurlTransport::Impl {
public:
    explicit Impl(const CurlTransportConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to initialize a curl handle";
            response.is_network_error = true;
            record(false);
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

        // Method and body
        if (request.method == HttpMethod::PUT) {
            curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
            if (request.body) {
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, read_callback);
                curl_easy_setopt(curl, CURLOPT_READDATA, request.body);
                if (auto size = request.body->size()) {
                    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                     static_cast<curl_off_t>(*size));
                }
                // Unknown size: libcurl falls back to chunked transfer encoding
            } else {
                // Empty-body PUT still needs Content-Length: 0
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
            }
        } else {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }

        // Headers
        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        const auto& opts = request.options;
        std::string user_agent = opts.user_agent.value_or(config_.user_agent);
        if (!user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
        }

        // Response callbacks
        WriteCallbackContext write_ctx{curl, &response.body, request.response_sink,
                                       config_.max_response_size, 0, false, false};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Timeouts
        auto connect_timeout = opts.connect_timeout.value_or(config_.default_connect_timeout);
        auto total_timeout = opts.total_timeout.value_or(config_.default_total_timeout);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(total_timeout.count()));

        // SSL
        if (opts.verify_ssl.value_or(true)) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }
        if (opts.ca_bundle_path && !opts.ca_bundle_path->empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, opts.ca_bundle_path->c_str());
        }

        // Proxy
        if (opts.proxy_url && !opts.proxy_url->empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, opts.proxy_url->c_str());
        }

        // Signed requests must not be replayed against another location
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        // Execute
        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        bool succeeded = false;
        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
            succeeded = true;
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = true;
        } else if (res == CURLE_ABORTED_BY_CALLBACK && request.body && request.body->failed()) {
            response.error = "Failed to read the upload source";
            response.is_network_error = true;
        } else if (res == CURLE_WRITE_ERROR && write_ctx.sink_failed) {
            response.error = "Failed to write response body to the destination stream";
            response.is_network_error = true;
        } else {
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        release_handle(curl);
        record(succeeded);

        return response;
    }

    PoolStats pool_stats() const {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return stats_;
    }

private:
    CURL* acquire_handle() {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        CURL* handle = nullptr;
        if (!idle_handles_.empty()) {
            handle = idle_handles_.back();
            idle_handles_.pop_back();
        } else {
            handle = curl_easy_init();
        }
        if (handle) {
            stats_.active_handles++;
        }
        stats_.idle_handles = idle_handles_.size();
        return handle;
    }

    void release_handle(CURL* handle) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        stats_.active_handles--;

        // Reset handle for reuse; keeps the connection cache
        curl_easy_reset(handle);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
        stats_.idle_handles = idle_handles_.size();
    }

    void record(bool succeeded) {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        stats_.total_requests++;
        if (!succeeded) stats_.failed_requests++;
    }

    CurlTransportConfig config_;
    mutable std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
    PoolStats stats_;
};

// ============================================================================
// CurlTransport public interface
// ============================================================================

CurlTransport::CurlTransport(const CurlTransportConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

CurlTransport::PoolStats CurlTransport::pool_stats() const {
    return impl_->pool_stats();
}

} // namespace nsclient::net
