#include "content_cache.hpp"

namespace lyricache {

std::string origin_to_string(ListingOrigin origin) {
    switch (origin) {
        case ListingOrigin::Parsed:           return "parsed";
        case ListingOrigin::FallbackFromName: return "fallback_from_name";
    }
    return "parsed";
}

} // namespace lyricache
