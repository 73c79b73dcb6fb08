/**
 * @file reason_mapper.h
 * @brief Canonical reason codes attached to failed execution results.
 */

#pragma once

#include "core/errors.h"

#include <string>
#include <string_view>

namespace tradegate {

struct ReasonMapping {
    std::string reason_code; // canonical reason code
    std::string reason_text; // human-readable text
};

class IReasonMapper {
public:
    virtual ~IReasonMapper() = default;
    virtual std::string canonical_code(std::string_view raw_code) const = 0;
    // Venue rejection text or tag (Hyperliquid order status error, Bybit retMsg).
    virtual ReasonMapping map_rejection(std::string_view raw_reason) const = 0;
    // Failure raised anywhere in an execution, with the venue's own code when it sent one.
    virtual ReasonMapping map_failure(ErrorKind kind,
                                      std::string_view venue_code,
                                      std::string_view message) const = 0;
};

class DefaultReasonMapper : public IReasonMapper {
public:
    std::string canonical_code(std::string_view raw_code) const override;
    ReasonMapping map_rejection(std::string_view raw_reason) const override;
    ReasonMapping map_failure(ErrorKind kind,
                              std::string_view venue_code,
                              std::string_view message) const override;
};

} // namespace tradegate
