#ifndef GAVEL_TYPES_HPP
#define GAVEL_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace gavel {

    // -----------------------------------------------------------------------------------
    // ---------------------------- Identifiers ------------------------------------------
    // -----------------------------------------------------------------------------------

    using ChannelId = std::string;  // opaque id of the hosting chat channel
    using UserId = std::string;     // opaque id of a participant
    using BidAmount = std::uint64_t; // smallest currency unit (silver)

    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    /** Source of "now" for the engine; the steady clock unless a test injects its own. */
    using TimeSource = std::function<TimePoint()>;

    inline TimePoint steadyNow() {
        return Clock::now();
    }

    // ==== ESCALA DE MONEDAS ====
    inline constexpr BidAmount MITHRIL_VALUE = 1000000;  // 1m = 100p
    inline constexpr BidAmount PLATINUM_VALUE = 10000;   // 1p = 100g
    inline constexpr BidAmount GOLD_VALUE = 100;         // 1g = 100s
    inline constexpr BidAmount SILVER_VALUE = 1;

    // ==== TIEMPOS DE SUBASTA ====
    inline constexpr std::chrono::seconds MINIMUM_AUCTION_DURATION{10};
    inline constexpr std::chrono::seconds ANTI_SNIPE_WINDOW{15};
    inline constexpr std::chrono::milliseconds EXPIRY_SCAN_INTERVAL{1000};

    // ==== DESPACHO DE NOTIFICACIONES ====
    inline constexpr std::size_t DEFAULT_DISPATCH_THREADS = 2;

} // namespace gavel

#endif // GAVEL_TYPES_HPP
