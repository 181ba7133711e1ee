#include "Auction.hpp"

namespace gavel {

    std::optional<StandingBid> highestBid(const Auction& auction) {
        std::optional<StandingBid> best;
        for (const auto& [bidder, amount] : auction.bids) {
            if (!best || amount > best->amount) {
                best = StandingBid{bidder, amount};
            }
        }
        return best;
    }

} // namespace gavel
