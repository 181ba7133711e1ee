#ifndef GAVEL_AUCTION_REGISTRY_HPP
#define GAVEL_AUCTION_REGISTRY_HPP

#include "Auction.hpp"
#include "Types.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace gavel {

    /**
     * Thread-safe store of active auctions, at most one per channel. The registry
     * lock only guards the map itself; each auction carries its own mutex so
     * unrelated channels never wait on each other.
     */
    class AuctionRegistry {
        public:
            using EntryPtr = std::shared_ptr<AuctionEntry>;

            AuctionRegistry() = default;
            ~AuctionRegistry() = default;

            AuctionRegistry(const AuctionRegistry&) = delete;
            AuctionRegistry& operator=(const AuctionRegistry&) = delete;

            /**
             * Inserts the auction unless its channel already has one.
             * Returns the new entry, or nullptr if the channel was taken.
             */
            EntryPtr insertIfAbsent(Auction auction);

            /**
             * Gets the entry of a channel, returns nullptr if there is none.
             */
            EntryPtr find(const ChannelId& channelId) const;

            /**
             * Removes the channel's entry only if it is still `expected`. Returns true
             * if this call removed it.
             */
            bool removeIfSame(const ChannelId& channelId, const EntryPtr& expected);

            /**
             * Copy of the current entries, taken under the registry lock.
             */
            std::vector<EntryPtr> snapshot() const;

            bool contains(const ChannelId& channelId) const;

            /**
             * Returns the number of active auctions.
             */
            std::size_t size() const;

        private:
            mutable std::mutex mtx;
            std::unordered_map<ChannelId, EntryPtr> auctions; // key = channel id
    };

} // namespace gavel

#endif // GAVEL_AUCTION_REGISTRY_HPP
