#ifndef GAVEL_NOTIFICATION_DISPATCHER_HPP
#define GAVEL_NOTIFICATION_DISPATCHER_HPP

#include "Notifier.hpp"
#include "Types.hpp"
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace gavel {

    enum class DispatchMode {
        Inline, // jobs run on the caller's thread (tests, single-threaded drivers)
        Async   // jobs run on the dispatcher's own worker threads
    };

    struct Delivery {
        NotificationTarget target;
        AuctionEvent event;
        bool noticeOnFailure = false; // si falla el DM, avisar en el canal
    };

    /**
     * Failure boundary between the engine and the external Notifier. Nothing thrown
     * by the notifier crosses this class; failed sends are logged and counted.
     *
     * In Async mode every channel gets its own strand on the pool: jobs for one
     * channel run one at a time in posting order, jobs for different channels run
     * in parallel. A channel's strand is dropped once its queue is empty.
     */
    class NotificationDispatcher {
        public:
            explicit NotificationDispatcher(Notifier& notifier,
                                            DispatchMode mode = DispatchMode::Async,
                                            std::size_t threads = DEFAULT_DISPATCH_THREADS);
            ~NotificationDispatcher();

            NotificationDispatcher(const NotificationDispatcher&) = delete;
            NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

            /**
             * Queues a job that resolves contacts and delivers events for a channel.
             * In Async mode the caller never waits on the notifier.
             */
            void post(const ChannelId& channelId, std::function<void()> job);

            /**
             * Sends one event. Returns false if the notifier threw.
             */
            bool deliver(const Delivery& delivery);

            /**
             * Sends a batch in order. Returns how many were delivered.
             */
            std::size_t deliverAll(const std::vector<Delivery>& deliveries);

            std::optional<Contact> resolveContact(const ChannelId& channelId, const UserId& userId);

            /**
             * Blocks until every job posted so far has finished.
             */
            void flush();

            std::size_t failedDeliveries() const;

            /**
             * Channels that still have queued or running jobs.
             */
            std::size_t activeChannels() const;

        private:
            using ChannelStrand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

            struct ChannelLane {
                ChannelStrand strand;
                std::size_t pending = 0;
            };

            void runJob(const std::function<void()>& job);
            void finishJob(const ChannelId& channelId);

            Notifier& notifier;
            DispatchMode mode;
            std::unique_ptr<boost::asio::thread_pool> pool;

            mutable std::mutex pendingMtx;
            std::condition_variable pendingCv;
            std::size_t pendingJobs = 0;
            std::unordered_map<ChannelId, ChannelLane> lanes; // key = channel id

            std::atomic<std::size_t> failures{0};
    };

} // namespace gavel

#endif // GAVEL_NOTIFICATION_DISPATCHER_HPP
