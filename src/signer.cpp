#include "nsclient/signer.hpp"
#include "nsclient/constants.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace nsclient {

// ============================================================================
// QueryFields
// ============================================================================

QueryFields::QueryFields(std::initializer_list<Field> fields) {
    for (const auto& [name, value] : fields) {
        set(name, value);
    }
}

void QueryFields::set(const std::string& name, const std::string& value) {
    for (auto& field : fields_) {
        if (field.first == name) {
            field.second = value;
            return;
        }
    }
    fields_.emplace_back(name, value);
}

QueryFields QueryFields::merged_with(const QueryFields& overrides) const {
    QueryFields merged = *this;
    for (const auto& [name, value] : overrides.fields_) {
        merged.set(name, value);
    }
    return merged;
}

std::string QueryFields::encode() const {
    std::string query;
    for (const auto& [name, value] : fields_) {
        if (!query.empty()) query += '&';
        query += querystring_escape(name);
        query += '=';
        query += querystring_escape(value);
    }
    return query;
}

QueryFields default_action_fields() {
    return QueryFields{
        {"version", constants::DEFAULT_API_VERSION},
        {"action", constants::DEFAULT_ACTION},
        {"format", constants::DEFAULT_FORMAT},
    };
}

std::string querystring_escape(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '!' || c == '~' ||
            c == '*' || c == '\'' || c == '(' || c == ')') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

// ============================================================================
// Crypto helpers
// ============================================================================

std::vector<uint8_t> hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    unsigned int hash_len = 0;

    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         hash, &hash_len);

    return std::vector<uint8_t>(hash, hash + hash_len);
}

static const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        size_t remaining = data.size() - i;
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (remaining > 1) triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (remaining > 2) triple |= static_cast<uint32_t>(data[i + 2]);

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += remaining > 1 ? base64_chars[(triple >> 6) & 0x3F] : '=';
        result += remaining > 2 ? base64_chars[triple & 0x3F] : '=';
    }

    return result;
}

std::string make_nonce() {
    unsigned char bytes[constants::NONCE_RANDOM_BYTES];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed to produce a nonce");
    }

    std::string nonce;
    for (unsigned char b : bytes) {
        nonce += std::to_string(static_cast<unsigned>(b));
    }
    return nonce + std::to_string(getpid());
}

std::string build_auth_data(int64_t timestamp, const std::string& nonce,
                            const std::string& key_name) {
    std::ostringstream oss;
    oss << constants::ACS_AUTH_VERSION << ", "
        << constants::ACS_CLIENT_IP << ", "
        << constants::ACS_SERVER_IP << ", "
        << timestamp << ", "
        << nonce << ", "
        << key_name;
    return oss.str();
}

std::string build_signed_message(const std::string& auth_data, const std::string& path,
                                 const std::string& query) {
    std::string signed_path = path;
    if (!signed_path.empty() && signed_path.back() == '/') {
        signed_path.pop_back();
    }
    // The action line keeps its trailing newline
    return auth_data + signed_path + "\n" +
           constants::SIGNED_ACTION_PREFIX + query + "\n";
}

// ============================================================================
// AuthHeaders / RequestSigner
// ============================================================================

void AuthHeaders::apply_to(net::HttpHeaders& headers) const {
    headers.set(constants::HEADER_ACS_ACTION, action);
    headers.set(constants::HEADER_ACS_AUTH_DATA, auth_data);
    headers.set(constants::HEADER_ACS_AUTH_SIGN, auth_sign);
}

RequestSigner::RequestSigner(const ClientConfig& config, Clock clock, NonceSource nonce)
    : config_(config)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); }))
    , nonce_(nonce ? std::move(nonce) : NonceSource(make_nonce)) {}

AuthHeaders RequestSigner::sign(const std::string& path, const QueryFields& fields) const {
    return sign(path, fields, config_, clock_(), nonce_());
}

AuthHeaders RequestSigner::sign(const std::string& path, const QueryFields& fields,
                                const ClientConfig& config,
                                std::chrono::system_clock::time_point now,
                                const std::string& nonce) {
    AuthHeaders headers;
    headers.action = default_action_fields().merged_with(fields).encode();

    int64_t timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    headers.auth_data = build_auth_data(timestamp, nonce, config.key_name);

    auto digest = hmac_sha256(config.key,
                              build_signed_message(headers.auth_data, path, headers.action));
    headers.auth_sign = base64_encode(digest);
    return headers;
}

}  // namespace nsclient
