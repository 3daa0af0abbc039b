#include "nsclient/path_materializer.hpp"
#include "nsclient/constants.hpp"

#include <utility>

namespace nsclient {

namespace {

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();

        std::string segment = path.substr(pos, slash - pos);
        if (segment == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        pos = slash + 1;
    }
    return segments;
}

}  // namespace

std::string normalize_path(const std::string& path) {
    std::string normalized;
    for (const auto& segment : split_segments(path)) {
        normalized += '/';
        normalized += segment;
    }
    return normalized.empty() ? "/" : normalized;
}

std::string join_target(const std::string& base_prefix, const std::string& target_path) {
    return normalize_path("/" + base_prefix + "/" + target_path);
}

std::vector<std::string> directory_chain(const std::string& absolute_path) {
    auto segments = split_segments(absolute_path);

    std::vector<std::string> chain;
    if (segments.size() < 2) return chain;
    chain.reserve(segments.size() - 1);

    std::string prefix;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        prefix += '/';
        prefix += segments[i];
        chain.push_back(prefix);
    }
    return chain;
}

PathMaterializer::PathMaterializer(CreateDirectory create_directory, std::string diagnostics)
    : create_directory_(std::move(create_directory))
    , diagnostics_(std::move(diagnostics)) {}

Status PathMaterializer::ensure_ancestors(const std::string& base_prefix,
                                          const std::string& target_path) const {
    return ensure_chain(directory_chain(join_target(base_prefix, target_path)));
}

Status PathMaterializer::ensure_chain(const std::vector<std::string>& chain) const {
    for (const auto& directory : chain) {
        ActionResult result = create_directory_(directory);
        if (result.success) continue;

        if (result.error.kind == ErrorKind::Protocol &&
            result.error.status == constants::STATUS_ALREADY_EXISTS) {
            continue;
        }

        Error error = std::move(result.error);
        error.message = "mkdir " + directory + ": " + error.message;
        if (!diagnostics_.empty()) {
            error.message += "\t" + diagnostics_;
        }
        return Status::fail(std::move(error));
    }
    return Status::ok();
}

}  // namespace nsclient
