#include "core/reasons/reason_mapper.h"
#include <iostream>

using tradegate::DefaultReasonMapper;
using tradegate::ErrorKind;

static int check(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "FAIL: " << msg << std::endl;
        return 1;
    }
    return 0;
}

int main() {
    DefaultReasonMapper m;
    int rc = 0;
    rc += check(m.canonical_code("missing_parameters") == "invalid_params", "canonical missing_parameters");
    rc += check(m.canonical_code("settlement_unknown") == "unknown_outcome", "canonical settlement_unknown");
    rc += check(m.map_rejection("Insufficient margin to place order.").reason_code == "insufficient_balance",
                "rejection margin->insufficient_balance");
    rc += check(m.map_rejection("Order must have minimum value of $10.").reason_code == "min_size",
                "rejection minimum value->min_size");
    rc += check(m.map_failure(ErrorKind::VenueRejection, "110007", "ab not enough for new order").reason_code == "insufficient_balance",
                "bybit 110007->insufficient_balance");
    rc += check(m.map_failure(ErrorKind::VenueRejection, "10006", "Too many visits").reason_code == "rate_limited",
                "bybit 10006->rate_limited");
    rc += check(m.map_failure(ErrorKind::Transport, "", "curl error").reason_code == "network_error",
                "transport->network_error");
    rc += check(m.map_failure(ErrorKind::SettlementUnknown, "", "not confirmed").reason_code == "unknown_outcome",
                "settlement->unknown_outcome");
    rc += check(m.map_failure(ErrorKind::Resolution, "", "asset not found").reason_code == "not_found",
                "resolution->not_found");
    if (rc == 0) std::cout << "reason_mapper_test: OK" << std::endl;
    return rc;
}
