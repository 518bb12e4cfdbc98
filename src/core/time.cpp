#include "vidingest/core/time.h"

#include <Poco/DateTime.h>
#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/DateTimeParser.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace vidingest::core {

// Fixed-width microsecond stamps keep lexicographic order equal to time order.
std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(),
                                           Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

std::string NowIso8601WithOffsetSeconds(long long delta_seconds) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(static_cast<long>(delta_seconds), 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FRAC_FORMAT);
}

long long MillisecondsSince(const std::string& iso8601) {
    Poco::DateTime parsed;
    int tzd = 0;
    if (!Poco::DateTimeParser::tryParse(Poco::DateTimeFormat::ISO8601_FRAC_FORMAT, iso8601,
                                        parsed, tzd)) {
        return -1;
    }
    parsed.makeUTC(tzd);
    const auto elapsed_us = Poco::Timestamp() - parsed.timestamp();
    return static_cast<long long>(elapsed_us / 1000);
}

}  // namespace vidingest::core
