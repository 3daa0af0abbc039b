#pragma once

#include "nsclient/client_config.hpp"
#include "nsclient/error.hpp"
#include "nsclient/net/http.hpp"
#include "nsclient/signer.hpp"

#include <ostream>
#include <string>

namespace nsclient {

/// Storage API actions
enum class Action {
    Upload,
    Download,
    Stat,
    Du,
    Dir,
    Delete,
    Mkdir,
    Rmdir,
    Rename,
    Symlink,
    Mtime
};

/// Wire name of an action ("upload", "du", ...)
const char* action_name(Action action);

/// Per-call parameters of one API request.
struct RequestParams {
    QueryFields action_fields;                       // merged over the defaults
    net::HttpMethod method = net::HttpMethod::GET;
    net::HttpHeaders headers;                        // overrides, caller wins
    net::UploadSource* body = nullptr;               // PUT body, not owned
    std::ostream* response_sink = nullptr;           // download destination, not owned

    /// Parameters for a plain action: action field set, everything else default.
    static RequestParams for_action(Action action,
                                    net::HttpMethod method = net::HttpMethod::GET);
};

/// Builds signed requests for one account and classifies responses.
/// Never retries; retry policy belongs to the transport.
class RequestBuilder {
public:
    RequestBuilder(const ClientConfig& config, RequestSigner signer);

    /// http[s]://host/<path without leading/trailing slashes>
    std::string build_url(const std::string& path) const;

    /// URL, signed headers (plus overrides), method, body and sink.
    net::HttpRequest build(const std::string& path, const RequestParams& params) const;

    /// 1. transport failure   -> Transport error, passed through as-is
    /// 2. status >= 300       -> Protocol error carrying the status
    /// 3. 2xx, non-XML body   -> {"status": code}
    /// 4. 2xx, XML body       -> parsed object, or Parse error
    ActionResult classify(const net::HttpResponse& response) const;

private:
    ClientConfig config_;
    RequestSigner signer_;
};

}  // namespace nsclient
