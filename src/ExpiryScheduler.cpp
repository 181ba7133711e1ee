#include "ExpiryScheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace gavel {

    ExpiryScheduler::ExpiryScheduler(AuctionRegistry& registryRef,
                                     Settlement& settlementRef,
                                     std::chrono::milliseconds scanInterval,
                                     TimeSource timeSource)
        : registry(registryRef),
          settlement(settlementRef),
          interval(scanInterval),
          now(std::move(timeSource)),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          scanTimer(io) {
        if (interval.count() <= 0) {
            throw std::invalid_argument("Scan interval must be positive");
        }
        if (!now) {
            throw std::invalid_argument("ExpiryScheduler requires a time source");
        }
    }

    ExpiryScheduler::~ExpiryScheduler() {
        stop();
    }

    void ExpiryScheduler::start() {
        if (running.load() || stopped.load()) return;

        running.store(true);

        startScanTimer();

        // Ejecutar io_context en hilo en segundo plano
        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "ExpiryScheduler IO context error: " << e.what() << std::endl;
            }
        });

        std::cout << "Expiry scheduler started, scanning every " << interval.count() << "ms" << std::endl;
    }

    void ExpiryScheduler::stop() {
        if (!running.load()) return;

        running.store(false);
        stopped.store(true);
        workGuard.reset();

        io.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        scanTimer.cancel(); // el hilo ya terminó, no hay carrera con el handler

        std::cout << "Expiry scheduler stopped" << std::endl;
    }

    bool ExpiryScheduler::isRunning() const {
        return running.load();
    }

    std::size_t ExpiryScheduler::scanOnce() {
        const TimePoint scanTime = now();
        std::size_t settledCount = 0;

        for (const auto& entry : registry.snapshot()) {
            auto closed = closeIfExpired(entry, scanTime);
            if (!closed) {
                continue;
            }
            settlement.settle(*closed);
            settledCount++;
        }

        return settledCount;
    }

    std::optional<Auction> ExpiryScheduler::closeIfExpired(const AuctionRegistry::EntryPtr& entry,
                                                           TimePoint scanTime) {
        std::lock_guard<std::mutex> lock(entry->mtx);
        if (entry->closed || !entry->auction.hasEnded(scanTime)) {
            return std::nullopt;
        }

        // Comprobar que sigue registrada y sacarla en la misma sección crítica
        if (!registry.removeIfSame(entry->auction.channelId, entry)) {
            return std::nullopt;
        }

        entry->closed = true;
        return std::move(entry->auction);
    }

    void ExpiryScheduler::startScanTimer() {
        scanTimer.expires_after(interval);
        scanTimer.async_wait([this](const boost::system::error_code& ec) {
            if (ec || !running.load()) {
                return;
            }
            try {
                scanOnce();
            } catch (const std::exception& e) {
                std::cerr << "Expiry scan failed: " << e.what() << std::endl;
            }
            startScanTimer();
        });
    }

} // namespace gavel
