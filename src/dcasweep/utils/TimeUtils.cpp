#include "TimeUtils.h"
#include <chrono>
#include <sstream>
#include <iomanip>

namespace dcasweep
{
namespace utils
{

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

boost::gregorian::date getToday()
{
    return boost::gregorian::day_clock::local_day();
}

std::string toIsoDateString(const boost::gregorian::date& d)
{
    if (d.is_special())
        return std::string();

    return boost::gregorian::to_iso_extended_string(d);
}

} // namespace utils
} // namespace dcasweep
