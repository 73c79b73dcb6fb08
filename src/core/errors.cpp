/**
 * @file errors.cpp
 */

#include "core/errors.h"

namespace tradegate {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Input: return "input";
        case ErrorKind::Signing: return "signing";
        case ErrorKind::Resolution: return "resolution";
        case ErrorKind::VenueRejection: return "venue_rejection";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::SettlementUnknown: return "settlement_unknown";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

} // namespace tradegate
