#ifndef GAVEL_CURRENCY_HPP
#define GAVEL_CURRENCY_HPP

#include "Types.hpp"
#include <string>

namespace gavel {

    // ============================================================
    //  ESCALA DE MONEDAS: m > p > g > s
    // ============================================================
    enum class CurrencyTier : int {
        Mithril  = 0,
        Platinum = 1,
        Gold     = 2,
        Silver   = 3
    };

    struct ParsedBid {
        BidAmount amount = 0;  // total en silver
        std::string display;   // descomposición greedy, p.ej. "1m 50p 100g 500s"
    };

    /** Maps a unit letter ('m', 'p', 'g', 's') to its tier. Returns false for any other char. */
    bool tierFromCode(char code, CurrencyTier& outTier);

    /** Value of one unit of the tier, in silver. */
    BidAmount tierValue(CurrencyTier tier);

    /** Lowercases the text and rewrites long unit names ("mithril", "plat", ...) to their letter. */
    std::string normalizeCurrencyNames(const std::string& text);

    /** Parsea una puja en texto libre.
     *  - Tokens separados por espacios, cada uno `<dígitos><letra>` exacto.
     *  - Las unidades deben ir en orden estrictamente descendente (m, p, g, s)
     *    y cada una a lo sumo una vez.
     *  - Un token inválido invalida la puja completa.
     * Devuelve false (sin tocar outBid) si el texto no es una puja válida.
     */
    bool parseBid(const std::string& text, ParsedBid& outBid);

    /** Greedy decomposition of an amount into tiers, zero tiers omitted, "0s" for zero. */
    std::string formatAmount(BidAmount amount);

} // namespace gavel

#endif // GAVEL_CURRENCY_HPP
