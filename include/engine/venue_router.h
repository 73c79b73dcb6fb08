/**
 * @file venue_router.h
 * @brief Registry of venue adapters keyed by Venue.
 */

#pragma once

#include <map>
#include <memory>

#include "adapters/venue_adapter.h"

namespace tradegate {

class VenueRouter {
public:
    // Replaces any adapter already registered for the same venue.
    void register_adapter(std::unique_ptr<IVenueAdapter> adapter) {
        if (!adapter) return;
        const Venue key = adapter->venue();
        adapters_[key] = std::move(adapter);
    }

    IVenueAdapter* get(Venue venue) const {
        auto it = adapters_.find(venue);
        return (it == adapters_.end()) ? nullptr : it->second.get();
    }

    bool empty() const { return adapters_.empty(); }

private:
    std::map<Venue, std::unique_ptr<IVenueAdapter>> adapters_;
};

} // namespace tradegate
