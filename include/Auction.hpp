#ifndef GAVEL_AUCTION_HPP
#define GAVEL_AUCTION_HPP

#include "Types.hpp"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace gavel {

    struct Auction {
        ChannelId channelId;
        std::string item;
        TimePoint endTime;
        std::unordered_map<UserId, BidAmount> bids; // best bid per bidder

        bool hasEnded(TimePoint now) const {
            return now >= endTime;
        }
    };

    struct StandingBid {
        UserId bidder;
        BidAmount amount = 0;
    };

    /**
     * Highest standing bid of the auction, or nullopt if nobody has bid.
     * Accepted bids are strict channel-wide maxima, so there is never a tie.
     */
    std::optional<StandingBid> highestBid(const Auction& auction);

    /**
     * Registry slot for one auction. `mtx` serializes bids, extensions and the
     * scheduler's close on this auction only; `closed` is set once, under `mtx`,
     * when the scheduler takes the auction out of the registry.
     */
    struct AuctionEntry {
        explicit AuctionEntry(Auction value) : auction(std::move(value)) {}

        mutable std::mutex mtx;
        Auction auction;
        bool closed = false;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_HPP
