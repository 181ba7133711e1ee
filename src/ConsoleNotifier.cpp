#include "ConsoleNotifier.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

namespace gavel {

    ConsoleNotifier::ConsoleNotifier(std::ostream& stream, std::string resultsChannel)
        : out(stream),
          resultsChannelId(std::move(resultsChannel)) {}

    void ConsoleNotifier::notifyChannel(const ChannelId& channelId, const AuctionEvent& event) {
        writeLine("[#" + channelId + "]", event);
    }

    void ConsoleNotifier::notifyUser(const UserTarget& user, const AuctionEvent& event) {
        writeLine("[dm @" + user.userId + "]", event);
    }

    void ConsoleNotifier::notifyResultsChannel(const AuctionEvent& event) {
        writeLine("[#" + resultsChannelId + " results]", event);
    }

    std::optional<Contact> ConsoleNotifier::resolveContact(const ChannelId& channelId, const UserId& userId) {
        (void)channelId;
        if (userId.empty()) {
            return std::nullopt;
        }
        return Contact{userId, userId};
    }

    void ConsoleNotifier::writeLine(const std::string& prefix, const AuctionEvent& event) {
        std::lock_guard<std::mutex> lock(outMtx);
        out << prefix << " " << describeEvent(event) << std::endl;
    }

    std::string describeEvent(const AuctionEvent& event) {
        std::ostringstream line;
        std::visit([&line](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, AuctionStarted>) {
                line << "SILENT AUCTION STARTED! item=`" << value.item << "` duration=`" << value.durationText
                     << "` (bids are private, 15s extension when outbid)";
            } else if constexpr (std::is_same_v<T, AuctionExtended>) {
                line << "AUCTION EXTENDED! item=`" << value.item << "` extension=`" << value.extension.count() << " seconds`";
            } else if constexpr (std::is_same_v<T, AuctionExtendedNotice>) {
                line << "Auction for `" << value.item << "` extended by a late bid";
            } else if constexpr (std::is_same_v<T, BidAccepted>) {
                line << "BID PLACED SUCCESSFULLY! item=`" << value.item << "` your bid=`" << value.displayAmount << "` status="
                     << (value.isHighest ? "You are the highest bidder!" : "You have been outbid.");
            } else if constexpr (std::is_same_v<T, OutbidAlert>) {
                line << "OUTBID ALERT! item=`" << value.item << "` your bid=`" << value.displayAmount
                     << "` Place a new bid to stay in the auction!";
            } else if constexpr (std::is_same_v<T, NoBidsResult>) {
                line << "AUCTION ENDED! item=`" << value.item << "` No bids were placed.";
            } else if constexpr (std::is_same_v<T, WinnerResult>) {
                line << "AUCTION ENDED! item=`" << value.item << "` winner=`" << value.winnerName << "`";
                if (value.displayAmount) {
                    line << " winning bid=`" << *value.displayAmount << "`";
                }
            } else if constexpr (std::is_same_v<T, WinnerCongratulation>) {
                line << "CONGRATULATIONS! You won `" << value.item << "` with `" << value.displayAmount << "`";
            } else {
                line << "@" << value.userId << " I couldn't send you a DM! Please enable DMs to receive notifications.";
            }
        }, event);
        return line.str();
    }

} // namespace gavel
