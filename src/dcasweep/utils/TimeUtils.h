#pragma once

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace dcasweep
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 *
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM" suitable for use in filenames.
 * Example: "Aug_25_2024_1430"
 *
 * @return Current timestamp as a formatted string
 */
std::string getCurrentTimestamp();

/**
 * @brief Today's date on the local clock
 */
boost::gregorian::date getToday();

/**
 * @brief Format a date as YYYY-MM-DD, or an empty string for special dates
 */
std::string toIsoDateString(const boost::gregorian::date& d);

} // namespace utils
} // namespace dcasweep
