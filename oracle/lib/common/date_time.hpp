/*
 * Helper functions for timestamps
 */

#pragma once

#include <cstdint>
#include <string>
#include <time.h>

namespace fhecredit
{
namespace oracle
{

// Convert a timestamp in seconds from Jan 01 1970 (UTC) to a struct tm
struct tm timestamp_to_tm(int64_t timestamp);

// Convert a struct tm to an ISO 8601 format string "YYYY-MM-DDTHH:MM:SSZ"
std::string tm_to_iso8601(const struct tm &date);

std::string timestamp_to_iso8601(int64_t timestamp);

} // namespace oracle
} // namespace fhecredit
