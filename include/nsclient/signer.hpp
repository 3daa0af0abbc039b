#pragma once

#include "nsclient/client_config.hpp"
#include "nsclient/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace nsclient {

/// Ordered query fields of the action header.
/// Field order is part of the signed payload: setting an existing name
/// replaces its value in place, new names are appended.
class QueryFields {
public:
    using Field = std::pair<std::string, std::string>;

    QueryFields() = default;
    QueryFields(std::initializer_list<Field> fields);

    void set(const std::string& name, const std::string& value);

    /// Copy of this with every field of overrides applied via set().
    QueryFields merged_with(const QueryFields& overrides) const;

    /// "name=value" pairs joined with '&', both sides querystring-escaped.
    std::string encode() const;

private:
    std::vector<Field> fields_;
};

/// {version: 1, action: "du", format: "xml"}
QueryFields default_action_fields();

/// Percent-encode everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
std::string querystring_escape(const std::string& value);

/// The three authentication headers of one request.
struct AuthHeaders {
    std::string action;     // X-Akamai-ACS-Action
    std::string auth_data;  // X-Akamai-ACS-Auth-Data
    std::string auth_sign;  // X-Akamai-ACS-Auth-Sign

    void apply_to(net::HttpHeaders& headers) const;
};

/// Signs requests for one account.
///
/// The signed message is
///   auth_data + path (one trailing '/' stripped) + "\n"
///   + "x-akamai-acs-action:" + query + "\n"
/// HMAC-SHA256 keyed by the account key, base64 encoded.
class RequestSigner {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using NonceSource = std::function<std::string()>;

    /// Clock and nonce source default to the system clock and make_nonce().
    explicit RequestSigner(const ClientConfig& config, Clock clock = {}, NonceSource nonce = {});

    /// Sign with the current time and a fresh nonce.
    AuthHeaders sign(const std::string& path, const QueryFields& fields) const;

    /// Deterministic form: no clock, no entropy.
    static AuthHeaders sign(const std::string& path, const QueryFields& fields,
                            const ClientConfig& config,
                            std::chrono::system_clock::time_point now,
                            const std::string& nonce);

private:
    ClientConfig config_;
    Clock clock_;
    NonceSource nonce_;
};

/// 6 random bytes as concatenated decimal values, followed by the process id.
/// Uses OpenSSL's RAND_bytes, safe to call from several threads.
/// Throws std::runtime_error if the entropy source fails.
std::string make_nonce();

/// "5, 0.0.0.0, 0.0.0.0, <timestamp>, <nonce>, <key_name>"
std::string build_auth_data(int64_t timestamp, const std::string& nonce,
                            const std::string& key_name);

std::string build_signed_message(const std::string& auth_data, const std::string& path,
                                 const std::string& query);

std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data);

std::string base64_encode(const std::vector<uint8_t>& data);

}  // namespace nsclient
