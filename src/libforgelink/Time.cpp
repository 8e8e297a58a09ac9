#include "Time.hpp"

#include <iomanip>
#include <sstream>
#include <chrono>
#include <locale>
#include <ctime>

namespace ForgeLink {
namespace Utils {

// "YYYY-MM-DD at HH:MM:SS [UTC]"
// If TimeZone::utc is used with the conversion functions, it will append the
// UTC letters to the end.
static const constexpr char *const DISPLAY_TIME_FMT = "%Y-%m-%d at %T";

// ISO8601Z representation of time, without time zone info
static const constexpr char *const ISO8601Z_TIME_FMT = "%Y%m%dT%H%M%SZ";

static const char * get_fmtstr(TimeFormat fmt)
{
    switch (fmt) {
    case TimeFormat::display: return DISPLAY_TIME_FMT;
    case TimeFormat::iso8601Z: return ISO8601Z_TIME_FMT;
    }

    return "";
}

namespace {

std::string process_format(const char *fmt, TimeZone zone)
{
    std::string fmtstr(fmt);

    if (fmtstr == DISPLAY_TIME_FMT && zone == TimeZone::utc)
        fmtstr += " UTC";

    return fmtstr;
}

} // namespace

time_t get_current_time_utc()
{
    using clk = std::chrono::system_clock;
    return clk::to_time_t(clk::now());
}

std::string time2str(const time_t &t, TimeZone zone, TimeFormat fmt)
{
    std::tm tms = {};
    tms.tm_isdst = -1;
    std::string fmtstr = process_format(get_fmtstr(fmt), zone);

    switch (zone) {
    case TimeZone::local: localtime_r(&t, &tms); break;
    case TimeZone::utc:   gmtime_r(&t, &tms); break;
    }

    std::stringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::put_time(&tms, fmtstr.c_str());
    return ss.str();
}

} // namespace Utils
} // namespace ForgeLink
