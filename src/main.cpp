#include <iostream>
#include <cstdlib>
#include <sstream>
#include <string>

#include "AuctionHouse.hpp"
#include "AuctionRegistry.hpp"
#include "ConsoleNotifier.hpp"
#include "EngineConfig.hpp"
#include "ExpiryScheduler.hpp"
#include "NotificationDispatcher.hpp"
#include "Settlement.hpp"
#include "Shutdown.hpp"

using namespace std;
using namespace gavel;

static void printUsage() {
    cout << "Commands:" << endl;
    cout << "  auction <channel> <item> <duration>   e.g. auction 7 Sword 5m" << endl;
    cout << "  bid <channel> <user> <amount...>      e.g. bid 7 alice 1m 50p" << endl;
    cout << "  say <channel> <user> <text...>" << endl;
    cout << "  quit" << endl;
}

static string restOfLine(istringstream& in) {
    string rest;
    getline(in, rest);
    size_t start = rest.find_first_not_of(' ');
    return start == string::npos ? string() : rest.substr(start);
}

int main(int argc, char** argv) {
    EngineConfig config;

    if (argc > 1) {
        long intervalMs = atol(argv[1]);
        if (intervalMs <= 0) {
            cerr << "Invalid scan interval: " << argv[1] << endl;
            return 1;
        }
        config.scanInterval = chrono::milliseconds(intervalMs);
    }

    string resultsChannelId;
    if (const char* env = getenv("AUCTION_RESULTS_CHANNEL_ID")) {
        resultsChannelId = env;
    }
    config.resultsChannelEnabled = !resultsChannelId.empty() && resultsChannelId != "0";

    cout << "gavel auction console starting. scan interval=" << config.scanInterval.count() << "ms"
         << " results channel=" << (config.resultsChannelEnabled ? resultsChannelId : "none") << endl;

    // Handle signals
    if (!installShutdownHandlers()) {
        return 1;
    }

    // Los hilos de trabajo heredan la máscara; las señales llegan al hilo de stdin
    if (!setShutdownSignalsBlocked(true)) {
        return 1;
    }

    ConsoleNotifier notifier(cout, resultsChannelId);
    NotificationDispatcher dispatcher(notifier, DispatchMode::Async, config.dispatchThreads);
    AuctionRegistry registry;
    AuctionHouse house(registry, dispatcher, config);
    const EngineConfig& active = house.getConfig();
    Settlement settlement(dispatcher, active.resultsChannelEnabled);
    ExpiryScheduler scheduler(registry, settlement, active.scanInterval);
    scheduler.start();

    if (!setShutdownSignalsBlocked(false)) {
        scheduler.stop();
        return 1;
    }

    printUsage();

    string line;
    while (!shutdownRequested() && getline(cin, line)) {
        istringstream in(line);
        string command;
        in >> command;

        if (command.empty()) {
            continue;
        }
        if (command == "quit") {
            break;
        }

        if (command == "auction") {
            string channel, item, duration;
            if (!(in >> channel >> item >> duration)) {
                printUsage();
                continue;
            }
            AuctionError result = house.startAuction(channel, item, duration);
            if (result != AuctionError::None) {
                cout << "[to moderator] " << errorMessage(result) << endl;
                cerr << "Auction start in channel " << channel << " rejected: " << errorToString(result) << endl;
            }
        } else if (command == "bid") {
            string channel, user;
            if (!(in >> channel >> user)) {
                printUsage();
                continue;
            }
            AuctionError result = house.placeBid(channel, user, restOfLine(in));
            if (result != AuctionError::None) {
                cout << "[to " << user << "] " << errorMessage(result) << endl;
                cerr << "Bid from user " << user << " in channel " << channel << " rejected: "
                     << errorToString(result) << endl;
            }
        } else if (command == "say") {
            string channel, user;
            if (!(in >> channel >> user)) {
                printUsage();
                continue;
            }
            string text = restOfLine(in);
            if (house.shouldSuppressMessage(channel, text)) {
                cout << "[#" << channel << "] [suppressed message from " << user << "]" << endl;
            } else {
                cout << "[#" << channel << "] " << user << ": " << text << endl;
            }
        } else {
            printUsage();
        }
    }

    cout << "Shutting down..." << endl;
    scheduler.stop();
    dispatcher.flush();
    return 0;
}
