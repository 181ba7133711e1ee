#include "BidPrivacy.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace gavel {

    namespace {
        const std::array<const char*, 8> BID_FRAGMENTS = {
            "p ", "g ", "s ", "m ", "plat", "gold", "silver", "mith"
        };
    }

    bool looksLikeBid(const std::string& message) {
        std::string content(message);
        std::transform(content.begin(), content.end(), content.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (content.rfind("!bid", 0) == 0) {
            return true;
        }

        return std::any_of(BID_FRAGMENTS.begin(), BID_FRAGMENTS.end(),
                           [&content](const char* fragment) {
                               return content.find(fragment) != std::string::npos;
                           });
    }

} // namespace gavel
