#include "nsclient/client.hpp"
#include "nsclient/client_config.hpp"
#include "nsclient/log.hpp"
#include "nsclient/metrics.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <system_error>

using nsclient::log_debug;
using nsclient::log_error;
using nsclient::log_info;

namespace {

// Prints the outcome of one action, returns the process exit code.
int report(const nsclient::ActionResult& result) {
    if (!result.success) {
        log_error("%s: %s", nsclient::error_kind_name(result.error.kind),
                  result.error.message.c_str());
        return 1;
    }
    log_info("%s", result.data.dump(2).c_str());
    return 0;
}

int report(const nsclient::Status& status) {
    if (!status.success) {
        log_error("%s: %s", nsclient::error_kind_name(status.error.kind),
                  status.error.message.c_str());
        return 1;
    }
    log_info("%s", nlohmann::json{{"success", true}}.dump(2).c_str());
    return 0;
}

// Opens a local file for upload; size is passed along so curl sends Content-Length.
std::unique_ptr<std::ifstream> open_local(const std::string& path, std::optional<uint64_t>& size) {
    auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*in) {
        log_error("cannot open %s", path.c_str());
        return nullptr;
    }
    std::error_code ec;
    auto bytes = std::filesystem::file_size(path, ec);
    if (!ec) size = bytes;
    return in;
}

int run(const nsclient::CliOptions& options, const nsclient::NetStorageClient& client) {
    const auto& cmd = options.command;
    const auto& args = options.args;

    if (cmd == "stat") return report(client.stat(args[0]));
    if (cmd == "du") return report(client.du(args[0]));
    if (cmd == "dir") return report(client.dir(args[0]));
    if (cmd == "delete") return report(client.remove(args[0]));
    if (cmd == "mkdir") return report(client.mkdir(args[0]));
    if (cmd == "rmdir") return report(client.rmdir(args[0]));
    if (cmd == "rename") return report(client.rename(args[0], args[1]));
    if (cmd == "symlink") return report(client.symlink(args[0], args[1]));
    if (cmd == "mtime") return report(client.mtime(args[0], args[1]));

    if (cmd == "exists") {
        auto result = client.file_exists(args[0]);
        if (!result.success) {
            log_error("%s: %s", nsclient::error_kind_name(result.error.kind),
                      result.error.message.c_str());
            return 1;
        }
        log_info("%s", nlohmann::json{{"exists", result.exists}}.dump(2).c_str());
        return 0;
    }

    if (cmd == "download") {
        std::ofstream out(args[1], std::ios::binary | std::ios::trunc);
        if (!out) {
            log_error("cannot open %s for writing", args[1].c_str());
            return 1;
        }
        auto result = client.download(args[0], out);
        out.close();
        if (!result.success) {
            std::error_code ec;
            std::filesystem::remove(args[1], ec);
        }
        return report(result);
    }

    if (cmd == "upload" || cmd == "create") {
        std::optional<uint64_t> size;
        auto in = open_local(args[0], size);
        if (!in) return 1;
        nsclient::net::StreamSource source(*in, size);

        if (cmd == "upload") return report(client.upload(source, args[1]));
        return report(client.create(source, args[1], args[2]));
    }

    log_error("unknown command: %s", cmd.c_str());
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto options_opt = nsclient::CliOptions::from_args(argc, argv);
    if (!options_opt) {
        return 1;
    }
    auto options = std::move(*options_opt);

    auto err = options.config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    if (options.config.verbose) {
        log_debug("host: %s (%s)", options.config.host.c_str(),
                  options.config.ssl ? "https" : "http");
        log_debug("key-name: %s", options.config.key_name.c_str());
        log_debug("key: %s", nsclient::constants::MASKED_SECRET);
    }

    std::unique_ptr<nsclient::ClientMetrics> metrics;
    if (!options.metrics_file.empty()) {
        metrics = std::make_unique<nsclient::ClientMetrics>(
            std::map<std::string, std::string>{{"host", options.config.host}});
    }

    nsclient::net::CurlTransportConfig transport_config;
    transport_config.verbose = options.config.verbose;
    auto transport = std::make_shared<nsclient::net::CurlTransport>(transport_config);

    int rc = 1;
    try {
        nsclient::NetStorageClient client(options.config, transport, metrics.get());
        rc = run(options, client);
    } catch (const std::exception& e) {
        log_error("%s failed: %s", options.command.c_str(), e.what());
        rc = 1;
    }

    if (metrics && !metrics->write_textfile(options.metrics_file)) {
        log_error("failed to write metrics to %s", options.metrics_file.c_str());
    }

    return rc;
}
