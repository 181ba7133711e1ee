#include "Settlement.hpp"

#include "Currency.hpp"

#include <iostream>
#include <vector>

namespace gavel {

    namespace {

        std::vector<Delivery> buildSettlementDeliveries(NotificationDispatcher& dispatcher,
                                                        const Auction& auction,
                                                        bool resultsChannelEnabled) {
            std::vector<Delivery> deliveries;
            const ChannelTarget channel{auction.channelId};

            const auto winner = highestBid(auction);
            if (!winner) {
                deliveries.push_back({channel, NoBidsResult{auction.item}});
                if (resultsChannelEnabled) {
                    deliveries.push_back({ResultsChannelTarget{}, NoBidsResult{auction.item}});
                }
                return deliveries;
            }

            const std::string display = formatAmount(winner->amount);
            const auto contact = dispatcher.resolveContact(auction.channelId, winner->bidder);
            const std::string winnerName = contact ? contact->displayName : winner->bidder;

            deliveries.push_back({channel, WinnerResult{auction.item, winnerName, std::nullopt}});
            if (resultsChannelEnabled) {
                deliveries.push_back({ResultsChannelTarget{}, WinnerResult{auction.item, winnerName, display}});
            }

            if (contact) {
                deliveries.push_back({UserTarget{auction.channelId, contact->userId},
                                      WinnerCongratulation{auction.item, display}});
            } else {
                std::cerr << "Winner " << winner->bidder << " of auction in channel " << auction.channelId
                          << " could not be resolved, skipping congratulation" << std::endl;
            }
            return deliveries;
        }

    } // namespace

    Settlement::Settlement(NotificationDispatcher& dispatcherRef, bool resultsEnabled)
        : dispatcher(dispatcherRef),
          resultsChannelEnabled(resultsEnabled) {}

    void Settlement::settle(const Auction& auction) {
        settled++;

        const auto winner = highestBid(auction);
        if (winner) {
            std::cout << "Auction ended in channel " << auction.channelId << ": " << auction.item
                      << " won by user " << winner->bidder << std::endl;
        } else {
            std::cout << "Auction ended in channel " << auction.channelId << ": " << auction.item
                      << " with no bids" << std::endl;
        }

        const bool toResults = resultsChannelEnabled;
        dispatcher.post(auction.channelId, [&target = dispatcher, auction, toResults]() {
            target.deliverAll(buildSettlementDeliveries(target, auction, toResults));
        });
    }

    std::size_t Settlement::settledCount() const {
        return settled.load();
    }

} // namespace gavel
