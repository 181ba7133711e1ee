#ifndef GAVEL_SETTLEMENT_HPP
#define GAVEL_SETTLEMENT_HPP

#include "Auction.hpp"
#include "NotificationDispatcher.hpp"
#include <atomic>
#include <cstddef>

namespace gavel {

    /**
     * Announces the outcome of a closed auction. The ExpiryScheduler calls settle()
     * exactly once per auction, after it has removed the auction from the registry.
     */
    class Settlement {
        public:
            Settlement(NotificationDispatcher& dispatcher, bool resultsChannelEnabled);

            /**
             * Posts the result notifications:
             *  - no bids: NoBidsResult to the channel (and results channel).
             *  - otherwise: WinnerResult without amount to the channel, WinnerResult with
             *    amount to the results channel, WinnerCongratulation to the winner.
             * A winner that cannot be resolved still gets announced by id; no DM is sent.
             */
            void settle(const Auction& auction);

            std::size_t settledCount() const;

        private:
            NotificationDispatcher& dispatcher;
            bool resultsChannelEnabled;
            std::atomic<std::size_t> settled{0};
    };

} // namespace gavel

#endif // GAVEL_SETTLEMENT_HPP
