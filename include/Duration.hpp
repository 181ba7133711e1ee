#ifndef GAVEL_DURATION_HPP
#define GAVEL_DURATION_HPP

#include <chrono>
#include <string>

namespace gavel {

    /** Parses `<digits>m` (minutes) or `<digits>h` (hours), case-insensitive.
     *  Returns false for anything else, including values the engine clock cannot represent.
     *  Zero is accepted here; the minimum auction length is applied by the caller.
     */
    bool parseDuration(const std::string& text, std::chrono::seconds& outDuration);

} // namespace gavel

#endif // GAVEL_DURATION_HPP
