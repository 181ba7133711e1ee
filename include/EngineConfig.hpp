#ifndef GAVEL_ENGINE_CONFIG_HPP
#define GAVEL_ENGINE_CONFIG_HPP

#include "Types.hpp"
#include <chrono>
#include <cstddef>

namespace gavel {

    // Who gets an OutbidAlert when a new high bid is accepted.
    enum class OutbidPolicy {
        AllOtherBidders,     // every other bidder, each with their own standing amount
        PreviousHighestOnly  // only the bidder who just lost the lead
    };

    struct EngineConfig {
        std::chrono::seconds minimumDuration = MINIMUM_AUCTION_DURATION;
        std::chrono::seconds antiSnipeWindow = ANTI_SNIPE_WINDOW;
        std::chrono::milliseconds scanInterval = EXPIRY_SCAN_INTERVAL;
        bool resultsChannelEnabled = false;
        OutbidPolicy outbidPolicy = OutbidPolicy::AllOtherBidders;
        std::size_t dispatchThreads = DEFAULT_DISPATCH_THREADS;
    };

} // namespace gavel

#endif // GAVEL_ENGINE_CONFIG_HPP
