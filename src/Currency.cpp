#include "Currency.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <sstream>
#include <utility>
#include <vector>

namespace gavel {

    namespace {

        // Las formas largas van antes que sus prefijos ("silver" antes de "sil")
        const std::array<std::pair<const char*, char>, 7> LONG_UNIT_NAMES = {{
            {"mithril", 'm'}, {"mith", 'm'},
            {"platinum", 'p'}, {"plat", 'p'},
            {"gold", 'g'},
            {"silver", 's'}, {"sil", 's'}
        }};

        const std::array<CurrencyTier, 4> TIERS_DESCENDING = {
            CurrencyTier::Mithril, CurrencyTier::Platinum, CurrencyTier::Gold, CurrencyTier::Silver
        };

        char tierCode(CurrencyTier tier) {
            switch (tier) {
                case CurrencyTier::Mithril: return 'm';
                case CurrencyTier::Platinum: return 'p';
                case CurrencyTier::Gold: return 'g';
                case CurrencyTier::Silver: return 's';
            }
            return '?';
        }

        void replaceAll(std::string& text, const std::string& from, char to) {
            size_t position = 0;
            while ((position = text.find(from, position)) != std::string::npos) {
                text.replace(position, from.size(), 1, to);
                position += 1;
            }
        }

        // Parses "<digits><unit>" into (count, tier). Rejects signs, decimals and trailing chars.
        bool parseToken(const std::string& token, BidAmount& count, CurrencyTier& tier) {
            if (token.size() < 2) {
                return false;
            }

            const char unit = token.back();
            if (!tierFromCode(unit, tier)) {
                return false;
            }

            BidAmount value = 0;
            for (size_t i = 0; i + 1 < token.size(); ++i) {
                const unsigned char c = static_cast<unsigned char>(token[i]);
                if (!std::isdigit(c)) {
                    return false;
                }
                const BidAmount digit = static_cast<BidAmount>(c - '0');
                if (value > (std::numeric_limits<BidAmount>::max() - digit) / 10) {
                    return false; // no cabe en 64 bits
                }
                value = value * 10 + digit;
            }

            count = value;
            return true;
        }

    } // namespace

    bool tierFromCode(char code, CurrencyTier& outTier) {
        switch (code) {
            case 'm': outTier = CurrencyTier::Mithril; return true;
            case 'p': outTier = CurrencyTier::Platinum; return true;
            case 'g': outTier = CurrencyTier::Gold; return true;
            case 's': outTier = CurrencyTier::Silver; return true;
            default: return false;
        }
    }

    BidAmount tierValue(CurrencyTier tier) {
        switch (tier) {
            case CurrencyTier::Mithril: return MITHRIL_VALUE;
            case CurrencyTier::Platinum: return PLATINUM_VALUE;
            case CurrencyTier::Gold: return GOLD_VALUE;
            case CurrencyTier::Silver: return SILVER_VALUE;
        }
        return 0;
    }

    std::string normalizeCurrencyNames(const std::string& text) {
        std::string normalized(text);
        std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        for (const auto& [longName, code] : LONG_UNIT_NAMES) {
            replaceAll(normalized, longName, code);
        }
        return normalized;
    }

    bool parseBid(const std::string& text, ParsedBid& outBid) {
        std::istringstream tokens(normalizeCurrencyNames(text));

        BidAmount total = 0;
        int lastTierIndex = -1;
        size_t tokenCount = 0;

        std::string token;
        while (tokens >> token) {
            BidAmount count = 0;
            CurrencyTier tier;
            if (!parseToken(token, count, tier)) {
                return false;
            }

            // Orden estricto: cada unidad debe ser menor que la anterior
            const int tierIndex = static_cast<int>(tier);
            if (tierIndex <= lastTierIndex) {
                return false;
            }
            lastTierIndex = tierIndex;

            const BidAmount unitValue = tierValue(tier);
            if (count > std::numeric_limits<BidAmount>::max() / unitValue) {
                return false;
            }
            const BidAmount contribution = count * unitValue;
            if (total > std::numeric_limits<BidAmount>::max() - contribution) {
                return false;
            }
            total += contribution;
            ++tokenCount;
        }

        if (tokenCount == 0) {
            return false;
        }

        outBid.amount = total;
        outBid.display = formatAmount(total);
        return true;
    }

    std::string formatAmount(BidAmount amount) {
        std::vector<std::string> parts;
        BidAmount remainder = amount;

        for (CurrencyTier tier : TIERS_DESCENDING) {
            const BidAmount unitValue = tierValue(tier);
            const BidAmount count = remainder / unitValue;
            remainder %= unitValue;
            if (count > 0) {
                parts.push_back(std::to_string(count) + tierCode(tier));
            }
        }

        if (parts.empty()) {
            return "0s";
        }

        std::ostringstream display;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                display << ' ';
            }
            display << parts[i];
        }
        return display.str();
    }

} // namespace gavel
