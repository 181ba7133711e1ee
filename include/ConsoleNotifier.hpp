#ifndef GAVEL_CONSOLE_NOTIFIER_HPP
#define GAVEL_CONSOLE_NOTIFIER_HPP

#include "Notifier.hpp"
#include <mutex>
#include <ostream>
#include <string>

namespace gavel {

    /**
     * Notifier for the console driver: every event becomes one line on the stream,
     * prefixed with where a chat transport would have sent it.
     */
    class ConsoleNotifier : public Notifier {
        public:
            ConsoleNotifier(std::ostream& out, std::string resultsChannelId);

            void notifyChannel(const ChannelId& channelId, const AuctionEvent& event) override;
            void notifyUser(const UserTarget& user, const AuctionEvent& event) override;
            void notifyResultsChannel(const AuctionEvent& event) override;
            std::optional<Contact> resolveContact(const ChannelId& channelId, const UserId& userId) override;

        private:
            void writeLine(const std::string& prefix, const AuctionEvent& event);

            std::ostream& out;
            std::string resultsChannelId;
            std::mutex outMtx;
    };

    /** Una línea legible para un evento (sin destino). */
    std::string describeEvent(const AuctionEvent& event);

} // namespace gavel

#endif // GAVEL_CONSOLE_NOTIFIER_HPP
