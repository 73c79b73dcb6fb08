/**
 * @file auth_provider.h
 * @brief Request-signing interface and the Bybit v5 HMAC implementation.
 */

#pragma once

#include "core/auth/monotonic_clock.h"

#include <memory>
#include <string>
#include <vector>
#include <utility>

namespace tradegate::auth {

struct HeaderKV { std::string name; std::string value; };

/// Lowercase hex HMAC-SHA256 of data keyed by key.
std::string hmac_sha256_hex(const std::string& key, const std::string& data);

class IAuthProvider {
public:
    virtual ~IAuthProvider() = default;
    // Build headers for a REST request. For GET the query string after '?' is signed, otherwise the body.
    virtual std::vector<HeaderKV> build_headers(const std::string& method,
                                                const std::string& endpoint,
                                                const std::string& params_json,
                                                const std::string& api_key,
                                                const std::string& api_secret,
                                                std::string& timestamp_out) const = 0;
};

class BybitAuthProvider final : public IAuthProvider {
public:
    explicit BybitAuthProvider(std::shared_ptr<MonotonicClock> clock = std::make_shared<MonotonicClock>(),
                               std::string recv_window = "5000")
        : clock_(std::move(clock)), recv_window_(std::move(recv_window)) {}

    std::vector<HeaderKV> build_headers(const std::string& method,
                                        const std::string& endpoint,
                                        const std::string& params_json,
                                        const std::string& api_key,
                                        const std::string& api_secret,
                                        std::string& timestamp_out) const override;

    const std::string& recv_window() const { return recv_window_; }

private:
    std::shared_ptr<MonotonicClock> clock_;
    std::string recv_window_;
};

} // namespace tradegate::auth
