#pragma once

#include "nsclient/constants.hpp"

#include <chrono>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace nsclient::net {

// HTTP methods used by the storage API
enum class HttpMethod {
    GET,
    PUT
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    // Copies every header of other into this one, replacing same-named ones
    void merge(const HttpHeaders& other);

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

private:
    // Headers stored as lowercase name -> (original name, value)
    std::map<std::string, HeaderPair> headers_;

    static std::string normalize_name(const std::string& name);
};

// Request body that is drained into the transport exactly once.
class UploadSource {
public:
    virtual ~UploadSource() = default;

    // Copy up to capacity bytes into dest. Returns 0 once exhausted.
    virtual size_t drain_into(uint8_t* dest, size_t capacity) = 0;

    // Total size if known up front (enables Content-Length)
    virtual std::optional<uint64_t> size() const = 0;

    // True if the source broke while draining; the transfer is aborted
    virtual bool failed() const { return false; }
};

// Single-shot adapter over an in-memory payload.
// The payload is owned by the caller and must outlive the upload.
class PayloadSource final : public UploadSource {
public:
    explicit PayloadSource(std::span<const uint8_t> payload);
    explicit PayloadSource(const std::string& payload);

    // A temporary would be freed before the upload drains it
    explicit PayloadSource(std::string&&) = delete;
    explicit PayloadSource(std::vector<uint8_t>&&) = delete;

    size_t drain_into(uint8_t* dest, size_t capacity) override;
    std::optional<uint64_t> size() const override { return payload_.size(); }

    bool exhausted() const { return offset_ >= payload_.size(); }

private:
    std::span<const uint8_t> payload_;
    size_t offset_ = 0;
};

// Single-shot source that owns its payload, for uploads that outlive the
// caller's scope (create_async).
class OwnedPayloadSource final : public UploadSource {
public:
    explicit OwnedPayloadSource(std::string payload);

    OwnedPayloadSource(const OwnedPayloadSource&) = delete;
    OwnedPayloadSource& operator=(const OwnedPayloadSource&) = delete;

    size_t drain_into(uint8_t* dest, size_t capacity) override;
    std::optional<uint64_t> size() const override { return payload_.size(); }

private:
    std::string payload_;
    PayloadSource view_;
};

// Adapter over a caller-owned input stream.
class StreamSource final : public UploadSource {
public:
    explicit StreamSource(std::istream& in, std::optional<uint64_t> size = std::nullopt);

    size_t drain_into(uint8_t* dest, size_t capacity) override;
    std::optional<uint64_t> size() const override { return size_; }

    bool failed() const override { return failed_; }

private:
    std::istream& in_;
    std::optional<uint64_t> size_;
    bool failed_ = false;
};

// Per-client transport settings. Unset fields keep the transport defaults.
struct TransportOptions {
    std::optional<std::chrono::milliseconds> connect_timeout;
    std::optional<std::chrono::milliseconds> total_timeout;
    std::optional<bool> verify_ssl;
    std::optional<std::string> ca_bundle_path;
    std::optional<std::string> proxy_url;
    std::optional<std::string> user_agent;
};

// HTTP request
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;

    // Streaming request body for PUT (not owned); nullptr sends an empty body
    UploadSource* body = nullptr;

    // When set, a 2xx response body is written here instead of being buffered
    std::ostream* response_sink = nullptr;

    TransportOptions options;
};

// HTTP response
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return is_success_status(status_code); }

    // Error info for requests that never produced an HTTP status
    std::string error;
    bool is_network_error = false;
};

// One outbound request per call. Implementations must be safe to call
// concurrently from several threads.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// Transport-wide configuration for CurlTransport
struct CurlTransportConfig {
    std::chrono::milliseconds default_connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds default_total_timeout{constants::DEFAULT_TOTAL_TIMEOUT_MS};
    size_t max_idle_handles = constants::DEFAULT_MAX_IDLE_HANDLES;
    size_t max_response_size = constants::DEFAULT_MAX_RESPONSE_SIZE;  // 0 = unlimited
    std::string user_agent = constants::DEFAULT_USER_AGENT;

    // libcurl wire tracing (for debugging)
    bool verbose = false;
};

// libcurl-backed transport with easy-handle reuse.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(const CurlTransportConfig& config = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    struct PoolStats {
        size_t active_handles = 0;
        size_t idle_handles = 0;
        size_t total_requests = 0;
        size_t failed_requests = 0;
    };
    PoolStats pool_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Escape bytes that may not appear literally in a URL path.
// '/' and already-legal characters are left alone.
std::string escape_url_path(const std::string& path);

} // namespace nsclient::net
