#include "NotificationDispatcher.hpp"

#include <boost/asio/post.hpp>
#include <iostream>
#include <stdexcept>

namespace gavel {

    NotificationDispatcher::NotificationDispatcher(Notifier& notifierRef, DispatchMode dispatchMode,
                                                   std::size_t threads)
        : notifier(notifierRef),
          mode(dispatchMode) {
        if (mode == DispatchMode::Async) {
            if (threads == 0) {
                throw std::invalid_argument("Dispatcher needs at least one worker thread");
            }
            pool = std::make_unique<boost::asio::thread_pool>(threads);
        }
    }

    NotificationDispatcher::~NotificationDispatcher() {
        flush();
        if (pool) {
            pool->join();
        }
    }

    void NotificationDispatcher::post(const ChannelId& channelId, std::function<void()> job) {
        if (mode == DispatchMode::Inline) {
            runJob(job);
            return;
        }

        std::lock_guard<std::mutex> lock(pendingMtx);
        auto it = lanes.find(channelId);
        if (it == lanes.end()) {
            it = lanes.emplace(channelId, ChannelLane{boost::asio::make_strand(pool->get_executor()), 0}).first;
        }
        it->second.pending++;
        pendingJobs++;

        // post() nunca ejecuta el handler en este hilo, así que el lock no se re-entra
        boost::asio::post(it->second.strand, [this, channelId, job = std::move(job)]() {
            runJob(job);
            finishJob(channelId);
        });
    }

    bool NotificationDispatcher::deliver(const Delivery& delivery) {
        try {
            notifier.deliver(delivery.target, delivery.event);
            return true;
        } catch (const std::exception& e) {
            failures++;
            std::cerr << "Failed to deliver " << eventName(delivery.event) << " to "
                      << targetToString(delivery.target) << ": " << e.what() << std::endl;
        }

        const auto* user = std::get_if<UserTarget>(&delivery.target);
        if (delivery.noticeOnFailure && user != nullptr) {
            try {
                notifier.notifyChannel(user->channelId, DmUnavailableNotice{user->userId});
            } catch (const std::exception& e) {
                failures++;
                std::cerr << "Could not post DM notice for user " << user->userId
                          << " in channel " << user->channelId << ": " << e.what() << std::endl;
            }
        }
        return false;
    }

    std::size_t NotificationDispatcher::deliverAll(const std::vector<Delivery>& deliveries) {
        std::size_t delivered = 0;
        for (const auto& delivery : deliveries) {
            if (deliver(delivery)) {
                delivered++;
            }
        }
        return delivered;
    }

    std::optional<Contact> NotificationDispatcher::resolveContact(const ChannelId& channelId,
                                                                  const UserId& userId) {
        try {
            return notifier.resolveContact(channelId, userId);
        } catch (const std::exception& e) {
            std::cerr << "Could not resolve user " << userId << " in channel " << channelId
                      << ": " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    void NotificationDispatcher::flush() {
        std::unique_lock<std::mutex> lock(pendingMtx);
        pendingCv.wait(lock, [this] { return pendingJobs == 0; });
    }

    std::size_t NotificationDispatcher::failedDeliveries() const {
        return failures.load();
    }

    void NotificationDispatcher::runJob(const std::function<void()>& job) {
        try {
            job();
        } catch (const std::exception& e) {
            std::cerr << "Notification job failed: " << e.what() << std::endl;
        }
    }

    std::size_t NotificationDispatcher::activeChannels() const {
        std::lock_guard<std::mutex> lock(pendingMtx);
        return lanes.size();
    }

    void NotificationDispatcher::finishJob(const ChannelId& channelId) {
        std::lock_guard<std::mutex> lock(pendingMtx);
        auto it = lanes.find(channelId);
        if (it != lanes.end() && --it->second.pending == 0) {
            lanes.erase(it);
        }
        pendingJobs--;
        if (pendingJobs == 0) {
            pendingCv.notify_all();
        }
    }

} // namespace gavel
