#ifndef GAVEL_BID_PRIVACY_HPP
#define GAVEL_BID_PRIVACY_HPP

#include <string>

namespace gavel {

    /**
     * Returns true if a plain chat message looks like a bid (a `!bid` command or any
     * currency fragment such as "50p " or "gold"). The transport deletes such messages
     * while an auction is active in the channel so amounts never show up in public.
     */
    bool looksLikeBid(const std::string& message);

} // namespace gavel

#endif // GAVEL_BID_PRIVACY_HPP
