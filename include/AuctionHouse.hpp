#ifndef GAVEL_AUCTION_HOUSE_HPP
#define GAVEL_AUCTION_HOUSE_HPP

#include "Auction.hpp"
#include "AuctionError.hpp"
#include "AuctionRegistry.hpp"
#include "EngineConfig.hpp"
#include "NotificationDispatcher.hpp"
#include "Types.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace gavel {

    /**
     * User-facing auction operations: opening an auction in a channel and placing
     * sealed bids on it. Closing is not done here; only the ExpiryScheduler
     * removes auctions from the registry.
     */
    class AuctionHouse {
        public:
            AuctionHouse(AuctionRegistry& registry,
                         NotificationDispatcher& dispatcher,
                         EngineConfig config = EngineConfig(),
                         TimeSource now = steadyNow);

            /**
             * Opens an auction for `item` in the channel. The deadline is
             * now + max(duration, minimumDuration).
             *
             * @return AuctionAlreadyActive if the channel has an auction,
             * InvalidDurationFormat if `durationText` is not `<n>m` / `<n>h`, None otherwise.
             */
            AuctionError startAuction(const ChannelId& channelId, const std::string& item,
                                      const std::string& durationText);

            /**
             * Places a bid. A bid is accepted only if it beats the bidder's own standing
             * bid and every other bid in the auction. A late bid from a new leader
             * (remaining <= antiSnipeWindow) pushes the deadline to now + antiSnipeWindow.
             */
            AuctionError placeBid(const ChannelId& channelId, const UserId& bidderId,
                                  const std::string& bidText);

            bool hasActiveAuction(const ChannelId& channelId) const;
            std::size_t activeAuctionCount() const;

            /**
             * Consistent copy of a channel's auction, or nullopt if there is none.
             */
            std::optional<Auction> snapshot(const ChannelId& channelId) const;

            /**
             * True if the message should be removed from the channel to keep bids private.
             */
            bool shouldSuppressMessage(const ChannelId& channelId, const std::string& message) const;

            const EngineConfig& getConfig() const;

        private:
            AuctionRegistry& registry;
            NotificationDispatcher& dispatcher;
            EngineConfig config;
            TimeSource now;
    };

} // namespace gavel

#endif // GAVEL_AUCTION_HOUSE_HPP
