#include "Notifier.hpp"

#include <type_traits>

namespace gavel {

    namespace {
        template <class... Ts>
        struct overloaded : Ts... {
            using Ts::operator()...;
        };
        template <class... Ts>
        overloaded(Ts...) -> overloaded<Ts...>;
    }

    void Notifier::deliver(const NotificationTarget& target, const AuctionEvent& event) {
        std::visit(overloaded{
            [&](const ChannelTarget& channel) { notifyChannel(channel.channelId, event); },
            [&](const UserTarget& user) { notifyUser(user, event); },
            [&](const ResultsChannelTarget&) { notifyResultsChannel(event); }
        }, target);
    }

    std::string eventName(const AuctionEvent& event) {
        return std::visit([](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AuctionStarted>) return "AuctionStarted";
            else if constexpr (std::is_same_v<T, AuctionExtended>) return "AuctionExtended";
            else if constexpr (std::is_same_v<T, AuctionExtendedNotice>) return "AuctionExtendedNotice";
            else if constexpr (std::is_same_v<T, BidAccepted>) return "BidAccepted";
            else if constexpr (std::is_same_v<T, OutbidAlert>) return "OutbidAlert";
            else if constexpr (std::is_same_v<T, NoBidsResult>) return "NoBidsResult";
            else if constexpr (std::is_same_v<T, WinnerResult>) return "WinnerResult";
            else if constexpr (std::is_same_v<T, WinnerCongratulation>) return "WinnerCongratulation";
            else return "DmUnavailableNotice";
        }, event);
    }

    std::string targetToString(const NotificationTarget& target) {
        return std::visit(overloaded{
            [](const ChannelTarget& channel) { return "channel:" + channel.channelId; },
            [](const UserTarget& user) { return "user:" + user.userId + "@channel:" + user.channelId; },
            [](const ResultsChannelTarget&) { return std::string("results-channel"); }
        }, target);
    }

} // namespace gavel
