#pragma once

#include "nsclient/net/http.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace nsclient {

/// Connection and credential settings for one storage account.
/// Bound to a NetStorageClient at construction and never modified afterwards;
/// several clients with different configurations may live in one process.
struct ClientConfig {
    std::string host;       // e.g. "example-nsu.akamaihd.net"
    bool ssl = false;       // https when true
    std::string key_name;   // upload account key name
    std::string key;        // shared HMAC secret
    bool verbose = false;   // include error bodies in messages, trace requests

    net::TransportOptions transport;

    /// Load configuration from a JSON file, overlaying onto current values.
    /// Returns error message or empty string.
    std::string load_json(const std::filesystem::path& path);

    /// Overlay values from an already parsed JSON object.
    /// Returns error message or empty string.
    std::string apply_json(const nlohmann::json& j);

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// JSON rendering for error diagnostics; the secret key is masked.
    nlohmann::json to_diagnostic_json() const;
};

/// Command line of the ns-client tool.
struct CliOptions {
    ClientConfig config;
    std::filesystem::path metrics_file;  // Prometheus textfile, optional

    std::string command;                 // stat, du, dir, upload, create, ...
    std::vector<std::string> args;       // command arguments

    /// Parse options and the command from argv.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<CliOptions> from_args(int argc, char* argv[]);

    /// Number of arguments a command expects, or -1 for an unknown command.
    static int expected_args(const std::string& command);
};

}  // namespace nsclient
