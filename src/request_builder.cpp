#include "nsclient/request_builder.hpp"
#include "nsclient/xml_response.hpp"

#include <utility>

namespace nsclient {

const char* action_name(Action action) {
    switch (action) {
        case Action::Upload: return "upload";
        case Action::Download: return "download";
        case Action::Stat: return "stat";
        case Action::Du: return "du";
        case Action::Dir: return "dir";
        case Action::Delete: return "delete";
        case Action::Mkdir: return "mkdir";
        case Action::Rmdir: return "rmdir";
        case Action::Rename: return "rename";
        case Action::Symlink: return "symlink";
        case Action::Mtime: return "mtime";
    }
    return "du";
}

RequestParams RequestParams::for_action(Action action, net::HttpMethod method) {
    RequestParams params;
    params.action_fields.set("action", action_name(action));
    params.method = method;
    return params;
}

RequestBuilder::RequestBuilder(const ClientConfig& config, RequestSigner signer)
    : config_(config), signer_(std::move(signer)) {}

std::string RequestBuilder::build_url(const std::string& path) const {
    size_t start = path.find_first_not_of('/');
    size_t end = path.find_last_not_of('/');
    std::string trimmed = start == std::string::npos
        ? std::string()
        : path.substr(start, end - start + 1);

    std::string url = config_.ssl ? "https://" : "http://";
    url += config_.host;
    url += '/';
    url += net::escape_url_path(trimmed);
    return url;
}

net::HttpRequest RequestBuilder::build(const std::string& path,
                                       const RequestParams& params) const {
    net::HttpRequest request;
    request.method = params.method;
    request.url = build_url(path);

    signer_.sign(path, params.action_fields).apply_to(request.headers);
    request.headers.merge(params.headers);

    request.body = params.body;
    request.response_sink = params.response_sink;
    request.options = config_.transport;
    return request;
}

ActionResult RequestBuilder::classify(const net::HttpResponse& response) const {
    ActionResult result;
    result.status = response.status_code;

    if (response.is_network_error) {
        result.error = Error::transport(response.error);
        return result;
    }

    if (response.status_code >= 300) {
        std::string message = "The server sent us the " +
                              std::to_string(response.status_code) + " code";
        if (config_.verbose && !response.body.empty()) {
            message += ". Body: " + response.body;
        }
        result.error = Error::protocol(response.status_code, message);
        return result;
    }

    if (!looks_like_xml(response.body)) {
        result.success = true;
        result.data = {{"status", response.status_code}};
        return result;
    }

    auto parsed = parse_structured_response(response.body);
    if (!parsed.success) {
        result.error = Error::parse(parsed.error_message);
        return result;
    }

    result.success = true;
    result.data = std::move(parsed.data);
    return result;
}

}  // namespace nsclient
