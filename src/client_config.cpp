#include "nsclient/client_config.hpp"
#include "nsclient/constants.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>

namespace nsclient {

// --- ClientConfig ---

std::string ClientConfig::load_json(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "cannot open config file: " + path.string();
    }
    try {
        return apply_json(nlohmann::json::parse(ifs));
    } catch (const nlohmann::json::exception& e) {
        return std::string("error parsing config: ") + e.what();
    }
}

std::string ClientConfig::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return "error parsing config: top level must be an object";
    }

    try {
        if (j.contains("host")) host = j["host"].get<std::string>();
        if (j.contains("ssl")) ssl = j["ssl"].get<bool>();
        if (j.contains("key_name")) key_name = j["key_name"].get<std::string>();
        if (j.contains("keyName")) key_name = j["keyName"].get<std::string>();
        if (j.contains("key")) key = j["key"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();

        // Transport overrides live under "request" (or "transport")
        for (const char* section : {"request", "transport"}) {
            if (!j.contains(section) || !j[section].is_object()) continue;
            const auto& jt = j[section];
            if (jt.contains("connect_timeout_ms"))
                transport.connect_timeout = std::chrono::milliseconds(jt["connect_timeout_ms"].get<int64_t>());
            if (jt.contains("timeout_ms"))
                transport.total_timeout = std::chrono::milliseconds(jt["timeout_ms"].get<int64_t>());
            if (jt.contains("verify_ssl")) transport.verify_ssl = jt["verify_ssl"].get<bool>();
            if (jt.contains("ca_bundle")) transport.ca_bundle_path = jt["ca_bundle"].get<std::string>();
            if (jt.contains("proxy")) transport.proxy_url = jt["proxy"].get<std::string>();
            if (jt.contains("user_agent")) transport.user_agent = jt["user_agent"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        return std::string("error parsing config: ") + e.what();
    }
    return {};
}

std::string ClientConfig::validate() const {
    if (host.empty()) return "host is required";
    if (host.find("://") != std::string::npos) return "host must not include a scheme: " + host;
    if (key_name.empty()) return "key_name is required";
    if (key.empty()) return "key is required";
    if (transport.connect_timeout && transport.connect_timeout->count() <= 0)
        return "connect_timeout_ms must be > 0";
    if (transport.total_timeout && transport.total_timeout->count() <= 0)
        return "timeout_ms must be > 0";
    return {};
}

nlohmann::json ClientConfig::to_diagnostic_json() const {
    nlohmann::json j = {
        {"host", host},
        {"ssl", ssl},
        {"keyName", key_name},
        {"key", key.empty() ? "" : constants::MASKED_SECRET},
        {"verbose", verbose},
    };

    nlohmann::json jt = nlohmann::json::object();
    if (transport.connect_timeout) jt["connect_timeout_ms"] = transport.connect_timeout->count();
    if (transport.total_timeout) jt["timeout_ms"] = transport.total_timeout->count();
    if (transport.verify_ssl) jt["verify_ssl"] = *transport.verify_ssl;
    if (transport.ca_bundle_path) jt["ca_bundle"] = *transport.ca_bundle_path;
    if (transport.proxy_url) jt["proxy"] = *transport.proxy_url;
    if (transport.user_agent) jt["user_agent"] = *transport.user_agent;
    if (!jt.empty()) j["request"] = jt;

    return j;
}

// --- CliOptions ---

namespace {

const std::map<std::string, int>& command_arity() {
    static const std::map<std::string, int> arity = {
        {"stat", 1},    {"du", 1},      {"dir", 1},      {"delete", 1},
        {"mkdir", 1},   {"rmdir", 1},   {"rename", 2},   {"symlink", 2},
        {"mtime", 2},   {"upload", 2},  {"download", 2}, {"create", 3},
        {"exists", 1},
    };
    return arity;
}

void print_usage() {
    std::cerr <<
        "Usage: ns-client [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  stat <path>                      File or directory metadata\n"
        "  du <path>                        Disk usage of a directory\n"
        "  dir <path>                       Directory listing\n"
        "  delete <path>                    Delete a file\n"
        "  mkdir <path>                     Create a directory\n"
        "  rmdir <path>                     Remove an empty directory\n"
        "  rename <from> <to>               Rename a file\n"
        "  symlink <target> <link>          Create a symbolic link at <link>\n"
        "  mtime <path> <date>              Set modification time (ISO-8601 or epoch seconds)\n"
        "  upload <local-file> <path>       Upload a file (parent directories must exist)\n"
        "  download <path> <local-file>     Download a file\n"
        "  create <local-file> <cpcode> <path>\n"
        "                                   Create parent directories, then upload\n"
        "  exists <path>                    Print whether a file exists\n"
        "\n"
        "Options:\n"
        "  --config <path>                  JSON config file\n"
        "  --host <host>                    Storage host (or NETSTORAGE_HOST env)\n"
        "  --key-name <name>                Upload account key name (or NETSTORAGE_KEY_NAME env)\n"
        "  --key <secret>                   Upload account key (or NETSTORAGE_KEY env)\n"
        "  --ssl                            Use https\n"
        "  --verbose                        Include error bodies, trace requests\n"
        "  --timeout-ms <N>                 Total request timeout\n"
        "  --connect-timeout-ms <N>         Connect timeout\n"
        "  --no-verify-ssl                  Skip TLS peer verification\n"
        "  --ca-bundle <path>               CA certificate bundle\n"
        "  --proxy <url>                    HTTP proxy\n"
        "  --metrics-file <path>            Prometheus .prom file written on exit\n"
        "  --help                           Show this help\n";
}

}  // namespace

int CliOptions::expected_args(const std::string& command) {
    auto it = command_arity().find(command);
    return it == command_arity().end() ? -1 : it->second;
}

std::optional<CliOptions> CliOptions::from_args(int argc, char* argv[]) {
    CliOptions options;
    ClientConfig& config = options.config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto parse_ms = [](const char* v, const char* name) -> std::optional<std::chrono::milliseconds> {
        try {
            return std::chrono::milliseconds(std::stoll(v));
        } catch (const std::exception&) {
            std::cerr << "Error: invalid value for " << name << ": " << v << "\n";
            return std::nullopt;
        }
    };

    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!arg.starts_with("--") || !positional.empty()) {
            positional.push_back(arg);
            continue;
        }

        if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            auto err = config.load_json(v);
            if (!err.empty()) {
                std::cerr << "Error: " << err << "\n";
                return std::nullopt;
            }
        } else if (arg == "--host") {
            auto* v = next_arg(i, "--host");
            if (!v) return std::nullopt;
            config.host = v;
        } else if (arg == "--key-name") {
            auto* v = next_arg(i, "--key-name");
            if (!v) return std::nullopt;
            config.key_name = v;
        } else if (arg == "--key") {
            auto* v = next_arg(i, "--key");
            if (!v) return std::nullopt;
            config.key = v;
        } else if (arg == "--ssl") {
            config.ssl = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--timeout-ms") {
            auto* v = next_arg(i, "--timeout-ms");
            if (!v) return std::nullopt;
            auto ms = parse_ms(v, "--timeout-ms");
            if (!ms) return std::nullopt;
            config.transport.total_timeout = *ms;
        } else if (arg == "--connect-timeout-ms") {
            auto* v = next_arg(i, "--connect-timeout-ms");
            if (!v) return std::nullopt;
            auto ms = parse_ms(v, "--connect-timeout-ms");
            if (!ms) return std::nullopt;
            config.transport.connect_timeout = *ms;
        } else if (arg == "--no-verify-ssl") {
            config.transport.verify_ssl = false;
        } else if (arg == "--ca-bundle") {
            auto* v = next_arg(i, "--ca-bundle");
            if (!v) return std::nullopt;
            config.transport.ca_bundle_path = v;
        } else if (arg == "--proxy") {
            auto* v = next_arg(i, "--proxy");
            if (!v) return std::nullopt;
            config.transport.proxy_url = v;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            options.metrics_file = v;
        } else if (arg == "--help") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    // Credentials from the environment when not given on the command line
    auto from_env = [](std::string& field, const char* name) {
        if (field.empty()) {
            if (const char* v = std::getenv(name)) field = v;
        }
    };
    from_env(config.host, "NETSTORAGE_HOST");
    from_env(config.key_name, "NETSTORAGE_KEY_NAME");
    from_env(config.key, "NETSTORAGE_KEY");

    if (positional.empty()) {
        std::cerr << "Error: a command is required\n";
        print_usage();
        return std::nullopt;
    }

    options.command = positional.front();
    options.args.assign(positional.begin() + 1, positional.end());

    int expected = expected_args(options.command);
    if (expected < 0) {
        std::cerr << "Error: unknown command: " << options.command << "\n";
        return std::nullopt;
    }
    if (static_cast<int>(options.args.size()) != expected) {
        std::cerr << "Error: " << options.command << " expects " << expected
                  << " argument(s), got " << options.args.size() << "\n";
        return std::nullopt;
    }

    return options;
}

}  // namespace nsclient
