/**
 * @file bybit_adapter.h
 * @brief Bybit v5 linear-perpetual market orders over signed REST.
 */

#pragma once

#include "adapters/venue_adapter.h"
#include "core/auth/auth_provider.h"
#include "core/config/engine_config.h"
#include "core/net/http_client.h"
#include "core/symbol/symbol_mapper.h"

#include <memory>
#include <string>

namespace tradegate {

class BybitAdapter final : public IVenueAdapter {
public:
    /// retCode for "leverage not modified"; treated as success.
    static constexpr int kLeverageNotModified = 110043;

    BybitAdapter(std::shared_ptr<const nethttp::IHttpClient> http,
                 BybitSettings settings,
                 std::shared_ptr<auth::MonotonicClock> clock = std::make_shared<auth::MonotonicClock>());

    Venue venue() const override { return Venue::Bybit; }
    VenueFill execute(const TradeIntent& intent, ExecutionContext& ctx) override;

    std::string build_leverage_body(const std::string& symbol, double leverage) const;
    std::string build_order_body(const std::string& symbol, Side side, const std::string& qty,
                                 bool reduce_only, const std::string& order_link_id) const;

private:
    struct Reply {
        int ret_code{-1};
        std::string ret_msg;
        std::string order_id;
        std::string order_link_id;
        std::string raw;
    };

    Reply signed_post(const std::string& path,
                      const std::string& body,
                      const auth::ApiKeyCredentials& creds,
                      ExecutionContext& ctx,
                      const char* label) const;

    void set_leverage(const std::string& symbol, double leverage,
                      const auth::ApiKeyCredentials& creds, ExecutionContext& ctx) const;

    std::shared_ptr<const nethttp::IHttpClient> http_;
    BybitSettings settings_;
    auth::BybitAuthProvider auth_;
    DefaultSymbolMapper symbols_;
};

} // namespace tradegate
