#include "attachvault/core/time.h"

#include <Poco/DateTimeFormat.h>
#include <Poco/DateTimeFormatter.h>
#include <Poco/Timespan.h>
#include <Poco/Timestamp.h>

namespace attachvault::core {

std::string NowIso8601() {
    return Poco::DateTimeFormatter::format(Poco::Timestamp(), Poco::DateTimeFormat::ISO8601_FORMAT);
}

std::string Iso8601FromNow(std::chrono::seconds offset) {
    Poco::Timestamp ts;
    ts += Poco::Timespan(static_cast<long>(offset.count()), 0);
    return Poco::DateTimeFormatter::format(ts, Poco::DateTimeFormat::ISO8601_FORMAT);
}

}  // namespace attachvault::core
