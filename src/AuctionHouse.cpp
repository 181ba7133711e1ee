#include "AuctionHouse.hpp"

#include "BidPrivacy.hpp"
#include "Currency.hpp"
#include "Duration.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace gavel {

    namespace {

        // Everything the notifications of one accepted bid need, copied out of the lock.
        struct AcceptedBid {
            ChannelId channelId;
            UserId bidder;
            std::string item;
            std::string display;
            std::optional<UserId> displaced;
            bool extended = false;
            std::chrono::seconds extension{0};
            std::vector<StandingBid> outbid;
        };

        std::vector<Delivery> buildBidDeliveries(NotificationDispatcher& dispatcher, const AcceptedBid& bid) {
            std::vector<Delivery> deliveries;
            const UserTarget bidderTarget{bid.channelId, bid.bidder};

            if (bid.extended) {
                const AuctionExtended extendedEvent{bid.item, bid.extension};
                if (bid.displaced) {
                    if (auto contact = dispatcher.resolveContact(bid.channelId, *bid.displaced)) {
                        deliveries.push_back({UserTarget{bid.channelId, contact->userId}, extendedEvent});
                    }
                }
                deliveries.push_back({bidderTarget, extendedEvent});
                deliveries.push_back({ChannelTarget{bid.channelId}, AuctionExtendedNotice{bid.item}});
            }

            deliveries.push_back({bidderTarget, BidAccepted{bid.item, bid.display, true}});

            for (const auto& standing : bid.outbid) {
                auto contact = dispatcher.resolveContact(bid.channelId, standing.bidder);
                if (!contact) {
                    std::cerr << "Skipping outbid alert for unreachable user " << standing.bidder
                              << " in channel " << bid.channelId << std::endl;
                    continue;
                }
                deliveries.push_back({UserTarget{bid.channelId, contact->userId},
                                      OutbidAlert{bid.item, formatAmount(standing.amount)},
                                      true});
            }

            return deliveries;
        }

    } // namespace

    AuctionHouse::AuctionHouse(AuctionRegistry& registryRef,
                               NotificationDispatcher& dispatcherRef,
                               EngineConfig engineConfig,
                               TimeSource timeSource)
        : registry(registryRef),
          dispatcher(dispatcherRef),
          config(engineConfig),
          now(std::move(timeSource)) {
        if (!now) {
            throw std::invalid_argument("AuctionHouse requires a time source");
        }
        if (config.minimumDuration.count() < 0 || config.antiSnipeWindow.count() < 0) {
            throw std::invalid_argument("Auction durations cannot be negative");
        }
    }

    AuctionError AuctionHouse::startAuction(const ChannelId& channelId, const std::string& item,
                                            const std::string& durationText) {
        if (registry.contains(channelId)) {
            return AuctionError::AuctionAlreadyActive;
        }

        std::chrono::seconds duration{0};
        if (!parseDuration(durationText, duration)) {
            return AuctionError::InvalidDurationFormat;
        }

        const TimePoint startedAt = now();
        const auto length = std::max(duration, config.minimumDuration);
        if (length > TimePoint::max() - startedAt) {
            return AuctionError::InvalidDurationFormat;
        }

        Auction auction;
        auction.channelId = channelId;
        auction.item = item;
        auction.endTime = startedAt + length;

        // Otro start pudo ganar la carrera entre contains() y aquí
        if (!registry.insertIfAbsent(std::move(auction))) {
            return AuctionError::AuctionAlreadyActive;
        }

        std::cout << "Auction started in channel " << channelId << ": " << item
                  << " (" << durationText << ")" << std::endl;

        dispatcher.post(channelId, [&target = dispatcher, channelId, item, durationText]() {
            target.deliver({ChannelTarget{channelId}, AuctionStarted{item, durationText}});
        });
        return AuctionError::None;
    }

    AuctionError AuctionHouse::placeBid(const ChannelId& channelId, const UserId& bidderId,
                                        const std::string& bidText) {
        auto entry = registry.find(channelId);
        if (!entry) {
            return AuctionError::NoActiveAuction;
        }

        ParsedBid parsed;
        const bool wellFormed = parseBid(bidText, parsed);

        AcceptedBid accepted;
        {
            std::lock_guard<std::mutex> lock(entry->mtx);
            const TimePoint bidTime = now();
            Auction& auction = entry->auction;

            if (entry->closed || auction.hasEnded(bidTime)) {
                return AuctionError::AuctionEnded;
            }
            if (!wellFormed) {
                return AuctionError::InvalidBidFormat;
            }

            // Sin puja previa el mínimo es 0, así que una puja de 0 nunca entra
            auto own = auction.bids.find(bidderId);
            const BidAmount ownAmount = own != auction.bids.end() ? own->second : 0;
            if (parsed.amount <= ownAmount) {
                return AuctionError::BidNotHigherThanOwn;
            }

            const auto leader = highestBid(auction);
            if (leader && parsed.amount <= leader->amount) {
                return AuctionError::BidNotHighestOverall;
            }

            // Anti-snipe: solo cuando un postor distinto toma la delantera
            const auto remaining = auction.endTime - bidTime;
            if (remaining <= config.antiSnipeWindow && leader && leader->bidder != bidderId) {
                auction.endTime = std::max(auction.endTime, bidTime + config.antiSnipeWindow);
                accepted.extended = true;
                accepted.extension = config.antiSnipeWindow;
            }

            auction.bids[bidderId] = parsed.amount;

            accepted.channelId = channelId;
            accepted.bidder = bidderId;
            accepted.item = auction.item;
            accepted.display = parsed.display;
            if (leader && leader->bidder != bidderId) {
                accepted.displaced = leader->bidder;
            }

            if (config.outbidPolicy == OutbidPolicy::AllOtherBidders) {
                for (const auto& [bidder, amount] : auction.bids) {
                    if (bidder != bidderId) {
                        accepted.outbid.push_back(StandingBid{bidder, amount});
                    }
                }
            } else if (accepted.displaced) {
                accepted.outbid.push_back(*leader);
            }
        }

        std::cout << "Bid accepted in channel " << channelId << " from user " << bidderId << std::endl;
        if (accepted.extended) {
            std::cout << "Auction in channel " << channelId << " extended by "
                      << accepted.extension.count() << "s" << std::endl;
        }

        dispatcher.post(channelId, [&target = dispatcher, bid = std::move(accepted)]() {
            target.deliverAll(buildBidDeliveries(target, bid));
        });
        return AuctionError::None;
    }

    bool AuctionHouse::hasActiveAuction(const ChannelId& channelId) const {
        return registry.contains(channelId);
    }

    std::size_t AuctionHouse::activeAuctionCount() const {
        return registry.size();
    }

    std::optional<Auction> AuctionHouse::snapshot(const ChannelId& channelId) const {
        auto entry = registry.find(channelId);
        if (!entry) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(entry->mtx);
        if (entry->closed) {
            return std::nullopt;
        }
        return entry->auction;
    }

    bool AuctionHouse::shouldSuppressMessage(const ChannelId& channelId, const std::string& message) const {
        return registry.contains(channelId) && looksLikeBid(message);
    }

    const EngineConfig& AuctionHouse::getConfig() const {
        return config;
    }

} // namespace gavel
