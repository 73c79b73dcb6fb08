/**
 * @file bybit_auth_provider.cpp
 */

#include "core/auth/auth_provider.h"
#include "core/errors.h"
#include "core/util/encoding.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>

namespace tradegate::auth {

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash, &hash_len)) {
        throw SigningError("HMAC-SHA256 failed");
    }
    return util::hex_encode(hash, hash_len);
}

std::vector<HeaderKV> BybitAuthProvider::build_headers(const std::string& method,
                                                       const std::string& endpoint,
                                                       const std::string& params_json,
                                                       const std::string& api_key,
                                                       const std::string& api_secret,
                                                       std::string& timestamp_out) const {
    if (api_key.empty() || api_secret.empty()) {
        throw InputError("missing API key or secret");
    }
    // Fresh stamp per call: a retried request must never reuse a signed timestamp.
    timestamp_out = std::to_string(clock_->next());
    std::string sign_payload = timestamp_out + api_key + recv_window_;
    if (method == "GET") {
        const auto qpos = endpoint.find('?');
        if (qpos != std::string::npos && qpos + 1 < endpoint.size()) {
            sign_payload += endpoint.substr(qpos + 1);
        }
    } else {
        if (!params_json.empty()) sign_payload += params_json;
    }
    const std::string signature = hmac_sha256_hex(api_secret, sign_payload);
    std::vector<HeaderKV> hdrs;
    hdrs.push_back({"X-BAPI-API-KEY", api_key});
    hdrs.push_back({"X-BAPI-TIMESTAMP", timestamp_out});
    hdrs.push_back({"X-BAPI-SIGN", signature});
    hdrs.push_back({"X-BAPI-RECV-WINDOW", recv_window_});
    hdrs.push_back({"Content-Type", "application/json"});
    return hdrs;
}

} // namespace tradegate::auth
