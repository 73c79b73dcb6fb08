/**
 * @file symbol_mapper.h
 * @brief Symbol normalization from human input to venue market names.
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tradegate {

class ISymbolMapper {
public:
    virtual ~ISymbolMapper() = default;
    // Strip separators and settle suffix, uppercase ("eth/usdt:usdt" or "ETH-USDT" -> "ETHUSDT")
    virtual std::string to_compact(std::string_view symbol) const = 0;
    // Base asset with a known quote suffix removed ("BTC/USDT", "BTCUSDT", "BTC-PERP" -> "BTC")
    virtual std::string to_base(std::string_view symbol) const = 0;
};

class DefaultSymbolMapper : public ISymbolMapper {
public:
    std::string to_compact(std::string_view symbol) const override;
    std::string to_base(std::string_view symbol) const override;

    // Names to try against a perp universe, most specific first, without duplicates.
    std::vector<std::string> perp_candidates(std::string_view symbol) const;
};

} // namespace tradegate
