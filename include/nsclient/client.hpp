#pragma once

#include "nsclient/client_config.hpp"
#include "nsclient/error.hpp"
#include "nsclient/net/http.hpp"
#include "nsclient/request_builder.hpp"

#include <chrono>
#include <cstdint>
#include <future>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <span>
#include <string>

namespace nsclient {

class ClientMetrics;

/// Client for one storage account.
///
/// Bound to an immutable ClientConfig at construction. Every call issues its
/// own signed request(s) and keeps no state between calls, so one client may
/// be used from several threads and several clients with different accounts
/// may coexist. Errors are returned, never logged.
class NetStorageClient {
public:
    /// @param transport  Shared HTTP transport; a CurlTransport when null.
    /// @param metrics    Optional request metrics, not owned.
    explicit NetStorageClient(ClientConfig config,
                              std::shared_ptr<net::HttpTransport> transport = nullptr,
                              ClientMetrics* metrics = nullptr);

    /// Same, with an explicit signer (fixed clock/nonce in tests).
    NetStorageClient(ClientConfig config, RequestSigner signer,
                     std::shared_ptr<net::HttpTransport> transport,
                     ClientMetrics* metrics = nullptr);

    NetStorageClient(const NetStorageClient&) = delete;
    NetStorageClient& operator=(const NetStorageClient&) = delete;

    const ClientConfig& config() const { return config_; }

    // --- Read-only verbs (GET) ---

    ActionResult stat(const std::string& path) const;
    ActionResult du(const std::string& path) const;
    ActionResult dir(const std::string& path) const;

    /// Stream a file into out. Only a 2xx body is written to out.
    ActionResult download(const std::string& path, std::ostream& out) const;

    // --- Mutating verbs (PUT) ---

    /// "delete" action
    ActionResult remove(const std::string& path) const;
    ActionResult mkdir(const std::string& path) const;
    ActionResult rmdir(const std::string& path) const;
    ActionResult rename(const std::string& from, const std::string& to) const;

    /// Create a symbolic link at link_path pointing to target.
    ActionResult symlink(const std::string& target, const std::string& link_path) const;

    /// Set the modification time, sent as whole Unix seconds.
    ActionResult mtime(const std::string& path, std::chrono::system_clock::time_point time) const;

    /// Textual form: "YYYY-MM-DDTHH:MM:SS[Z]", "YYYY-MM-DD" (UTC) or decimal
    /// Unix seconds. Anything else fails with a Validation error and no request.
    ActionResult mtime(const std::string& path, const std::string& date) const;

    /// Upload without creating parent directories.
    ActionResult upload(net::UploadSource& source, const std::string& path) const;

    // --- Helpers ---

    /// stat-based existence check: 404 -> false, a "file" entry -> true.
    ExistsResult file_exists(const std::string& path) const;

    /// Create the ancestors of "/<base_prefix>/<target_path>" in order
    /// (409 tolerated), then upload source to it. The upload is attempted at
    /// most once and only after every directory exists; directories created
    /// before a failure are not rolled back.
    Status create(net::UploadSource& source, const std::string& base_prefix,
                  const std::string& target_path) const;
    Status create(std::span<const uint8_t> payload, const std::string& base_prefix,
                  const std::string& target_path) const;
    Status create(std::istream& in, const std::string& base_prefix,
                  const std::string& target_path) const;

    /// create() on a background thread; the future resolves exactly once.
    /// The client must outlive the returned future; the source is kept alive
    /// by the shared_ptr (use OwnedPayloadSource for temporary payloads).
    std::future<Status> create_async(std::shared_ptr<net::UploadSource> source,
                                     std::string base_prefix,
                                     std::string target_path) const;

private:
    ActionResult execute(Action action, const std::string& path,
                         const RequestParams& params) const;
    ActionResult simple(Action action, const std::string& path,
                        net::HttpMethod method) const;

    const ClientConfig config_;
    RequestBuilder builder_;
    std::shared_ptr<net::HttpTransport> transport_;
    ClientMetrics* metrics_;
};

/// Parse the textual date forms accepted by NetStorageClient::mtime.
std::optional<std::chrono::system_clock::time_point> parse_date(const std::string& date);

}  // namespace nsclient
