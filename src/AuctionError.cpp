#include "AuctionError.hpp"

namespace gavel {

    std::string errorToString(AuctionError error) {
        switch (error) {
            case AuctionError::None: return "None";
            case AuctionError::InvalidBidFormat: return "InvalidBidFormat";
            case AuctionError::InvalidDurationFormat: return "InvalidDurationFormat";
            case AuctionError::AuctionAlreadyActive: return "AuctionAlreadyActive";
            case AuctionError::NoActiveAuction: return "NoActiveAuction";
            case AuctionError::AuctionEnded: return "AuctionEnded";
            case AuctionError::BidNotHigherThanOwn: return "BidNotHigherThanOwn";
            case AuctionError::BidNotHighestOverall: return "BidNotHighestOverall";
            default: return "UNKNOWN";
        }
    }

    std::string errorMessage(AuctionError error) {
        switch (error) {
            case AuctionError::None:
                return "OK";
            case AuctionError::InvalidBidFormat:
                return "Invalid bid format. Use e.g. `1m 50p 100g 500s` (highest tier first).";
            case AuctionError::InvalidDurationFormat:
                return "Invalid duration format. Use: `5m` for 5 minutes or `2h` for 2 hours";
            case AuctionError::AuctionAlreadyActive:
                return "An auction is already running in this channel!";
            case AuctionError::NoActiveAuction:
                return "No active auction in this channel!";
            case AuctionError::AuctionEnded:
                return "This auction has ended!";
            case AuctionError::BidNotHigherThanOwn:
                return "Your new bid must be higher than your previous bid!";
            case AuctionError::BidNotHighestOverall:
                return "Your bid must be higher than the current highest bid!";
            default:
                return "Unknown error";
        }
    }

} // namespace gavel
