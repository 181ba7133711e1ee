#include "Duration.hpp"
#include "Types.hpp"

#include <cctype>
#include <cstdint>

namespace gavel {

    bool parseDuration(const std::string& text, std::chrono::seconds& outDuration) {
        if (text.size() < 2) {
            return false;
        }

        const char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(text.back())));
        std::int64_t secondsPerUnit = 0;
        if (unit == 'm') {
            secondsPerUnit = 60;
        } else if (unit == 'h') {
            secondsPerUnit = 3600;
        } else {
            return false;
        }

        // Debe caber en la resolución del reloj, no solo en segundos
        const std::int64_t maxSeconds =
            std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count();
        const std::int64_t maxUnits = maxSeconds / secondsPerUnit;
        std::int64_t units = 0;
        for (size_t i = 0; i + 1 < text.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(text[i]);
            if (!std::isdigit(c)) {
                return false;
            }
            const std::int64_t digit = c - '0';
            if (units > (maxUnits - digit) / 10) {
                return false;
            }
            units = units * 10 + digit;
        }

        outDuration = std::chrono::seconds(units * secondsPerUnit);
        return true;
    }

} // namespace gavel
