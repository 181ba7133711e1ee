#include "AuctionRegistry.hpp"

#include <algorithm>
#include <iterator>

namespace gavel {

    AuctionRegistry::EntryPtr AuctionRegistry::insertIfAbsent(Auction auction) {
        std::lock_guard<std::mutex> lock(mtx);
        const ChannelId channelId = auction.channelId;
        if (auctions.find(channelId) != auctions.end()) {
            return nullptr;
        }

        auto entry = std::make_shared<AuctionEntry>(std::move(auction));
        auctions.emplace(channelId, entry);
        return entry;
    }

    AuctionRegistry::EntryPtr AuctionRegistry::find(const ChannelId& channelId) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = auctions.find(channelId);
        if (it != auctions.end()) {
            return it->second;
        }
        return nullptr;
    }

    bool AuctionRegistry::removeIfSame(const ChannelId& channelId, const EntryPtr& expected) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = auctions.find(channelId);
        if (it != auctions.end() && it->second == expected) {
            auctions.erase(it);
            return true;
        }
        return false;
    }

    std::vector<AuctionRegistry::EntryPtr> AuctionRegistry::snapshot() const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<EntryPtr> result;
        result.reserve(auctions.size());

        std::transform(auctions.begin(), auctions.end(), std::back_inserter(result),
                      [](const auto& pair) { return pair.second; });

        return result;
    }

    bool AuctionRegistry::contains(const ChannelId& channelId) const {
        std::lock_guard<std::mutex> lock(mtx);
        return auctions.find(channelId) != auctions.end();
    }

    std::size_t AuctionRegistry::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return auctions.size();
    }

} // namespace gavel
