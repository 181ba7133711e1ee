#ifndef GAVEL_AUCTION_ERROR_HPP
#define GAVEL_AUCTION_ERROR_HPP

#include <string>

namespace gavel {

    // ============================================================
    //  ERRORES DE ENTRADA DE USUARIO
    // ============================================================

    /**
     * Outcome of a user-initiated auction operation. Every value other than
     * `None` is reported back to the initiating user only and leaves the
     * auction untouched.
     */
    enum class AuctionError {
        None = 0,
        InvalidBidFormat,
        InvalidDurationFormat,
        AuctionAlreadyActive,
        NoActiveAuction,
        AuctionEnded,
        BidNotHigherThanOwn,
        BidNotHighestOverall
    };

    /** Stable identifier of an error (útil para logs y tests). */
    std::string errorToString(AuctionError error);

    /** Sentence shown to the user who triggered the error. */
    std::string errorMessage(AuctionError error);

} // namespace gavel

#endif // GAVEL_AUCTION_ERROR_HPP
