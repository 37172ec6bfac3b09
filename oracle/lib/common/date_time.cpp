#include "lib/common/date_time.hpp"

#include <cstdio>

#include "lib/common/oracle_exception.hpp"

namespace fhecredit
{
namespace oracle
{

struct tm timestamp_to_tm(int64_t timestamp)
{
    if (timestamp < 0)
        THROW_EXCEPTION(kInvalidInput, "Timestamp predates the epoch");

    const time_t time = static_cast<time_t>(timestamp);
    struct tm date = {};
    if (gmtime_r(&time, &date) == nullptr)
        THROW_EXCEPTION(kInvalidInput, "Could not convert timestamp to a date");

    return date;
}

std::string tm_to_iso8601(const struct tm &date)
{
    char buffer[32] = {'\0'};
    snprintf(buffer,
             sizeof(buffer),
             "%04d-%02d-%02dT%02d:%02d:%02dZ",
             date.tm_year + 1900,
             date.tm_mon + 1,
             date.tm_mday,
             date.tm_hour,
             date.tm_min,
             date.tm_sec);
    return buffer;
}

std::string timestamp_to_iso8601(int64_t timestamp)
{
    return tm_to_iso8601(timestamp_to_tm(timestamp));
}

} // namespace oracle
} // namespace fhecredit
