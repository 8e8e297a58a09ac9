#ifndef forgelink_Utils_Time_hpp_
#define forgelink_Utils_Time_hpp_

#include <string>
#include <ctime>

namespace ForgeLink {
namespace Utils {

// Should be thread safe.
time_t get_current_time_utc();

enum class TimeZone { local, utc };
enum class TimeFormat { display, iso8601Z };

// time_t to string functions...

std::string time2str(const time_t &t, TimeZone zone, TimeFormat fmt);

inline std::string time2str(TimeZone zone, TimeFormat fmt)
{
    return time2str(get_current_time_utc(), zone, fmt);
}

// "YYYYMMDDTHHMMSSZ", handy for file names.
inline std::string iso_utc_timestamp(time_t t)
{
    return time2str(t, TimeZone::utc, TimeFormat::iso8601Z);
}

} // namespace Utils
} // namespace ForgeLink

#endif /* forgelink_Utils_Time_hpp_ */
