#ifndef GAVEL_NOTIFIER_HPP
#define GAVEL_NOTIFIER_HPP

#include "Types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace gavel {

    // ============================================================
    //  DESTINOS
    // ============================================================
    struct ChannelTarget {
        ChannelId channelId;
    };

    // channelId is the context the user was reached through (the auction's channel).
    struct UserTarget {
        ChannelId channelId;
        UserId userId;
    };

    struct ResultsChannelTarget {};

    using NotificationTarget = std::variant<ChannelTarget, UserTarget, ResultsChannelTarget>;

    // ============================================================
    //  EVENTOS
    // ============================================================
    struct AuctionStarted {
        std::string item;
        std::string durationText;
    };

    // Sent privately to the displaced and to the new high bidder.
    struct AuctionExtended {
        std::string item;
        std::chrono::seconds extension{0};
    };

    // Public, no bidder identity.
    struct AuctionExtendedNotice {
        std::string item;
    };

    struct BidAccepted {
        std::string item;
        std::string displayAmount;
        bool isHighest = true;
    };

    struct OutbidAlert {
        std::string item;
        std::string displayAmount; // the outbid user's own standing bid
    };

    struct NoBidsResult {
        std::string item;
    };

    struct WinnerResult {
        std::string item;
        std::string winnerName;
        std::optional<std::string> displayAmount; // only on the results channel
    };

    struct WinnerCongratulation {
        std::string item;
        std::string displayAmount;
    };

    // A private message could not be delivered; asks the user in channel to open their DMs.
    struct DmUnavailableNotice {
        UserId userId;
    };

    using AuctionEvent = std::variant<
        AuctionStarted,
        AuctionExtended,
        AuctionExtendedNotice,
        BidAccepted,
        OutbidAlert,
        NoBidsResult,
        WinnerResult,
        WinnerCongratulation,
        DmUnavailableNotice>;

    struct Contact {
        UserId userId;
        std::string displayName;
    };

    /**
     * Transport-side capability the engine talks to. Every send may throw (no
     * permission, user unreachable); the engine catches and logs, never retries.
     */
    class Notifier {
        public:
            virtual ~Notifier() = default;

            /**
             * Routes an event to the send operation matching the target's kind.
             */
            void deliver(const NotificationTarget& target, const AuctionEvent& event);

            virtual void notifyChannel(const ChannelId& channelId, const AuctionEvent& event) = 0;
            virtual void notifyUser(const UserTarget& user, const AuctionEvent& event) = 0;
            virtual void notifyResultsChannel(const AuctionEvent& event) = 0;

            /**
             * Looks a user up in the context of a channel. Returns nullopt if the user
             * cannot be contacted (left the server, unknown id).
             */
            virtual std::optional<Contact> resolveContact(const ChannelId& channelId, const UserId& userId) = 0;
    };

    /** Nombre del evento (útil para logs). */
    std::string eventName(const AuctionEvent& event);

    /** Describe un destino, p.ej. "user:42@channel:7" (útil para logs). */
    std::string targetToString(const NotificationTarget& target);

} // namespace gavel

#endif // GAVEL_NOTIFIER_HPP
