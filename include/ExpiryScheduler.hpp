#ifndef GAVEL_EXPIRY_SCHEDULER_HPP
#define GAVEL_EXPIRY_SCHEDULER_HPP

#include "Auction.hpp"
#include "AuctionRegistry.hpp"
#include "Settlement.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>

namespace gavel {

    /**
     * Periodic scan that closes auctions whose deadline has passed. Each expired
     * auction is removed from the registry and handed to Settlement exactly once,
     * even if scans overlap or race with bids on the same channel.
     *
     * The timer runs on its own io thread; no lock is held between ticks.
     * A stopped scheduler cannot be started again.
     */
    class ExpiryScheduler {
        public:
            ExpiryScheduler(AuctionRegistry& registry,
                            Settlement& settlement,
                            std::chrono::milliseconds interval = EXPIRY_SCAN_INTERVAL,
                            TimeSource now = steadyNow);
            ~ExpiryScheduler();

            ExpiryScheduler(const ExpiryScheduler&) = delete;
            ExpiryScheduler& operator=(const ExpiryScheduler&) = delete;

            void start();
            void stop();
            bool isRunning() const;

            /**
             * One pass over the registry: snapshot the entries, then close and settle
             * every auction with endTime <= now that is still registered.
             *
             * @return the number of auctions settled by this pass.
             */
            std::size_t scanOnce();

        private:
            std::optional<Auction> closeIfExpired(const AuctionRegistry::EntryPtr& entry, TimePoint scanTime);

            void startScanTimer();

            AuctionRegistry& registry;
            Settlement& settlement;
            std::chrono::milliseconds interval;
            TimeSource now;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            boost::asio::steady_timer scanTimer;

            std::thread ioThread;
            std::atomic<bool> running{false};
            std::atomic<bool> stopped{false};
    };

} // namespace gavel

#endif // GAVEL_EXPIRY_SCHEDULER_HPP
