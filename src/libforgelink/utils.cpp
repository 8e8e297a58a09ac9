#include "Utils.hpp"
#include "Exception.hpp"

#include <map>
#include <cstdio>

#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/support/date_time.hpp>

#include <boost/filesystem.hpp>
#include <boost/filesystem/path.hpp>

namespace ForgeLink {

static boost::log::trivial::severity_level logSeverity = boost::log::trivial::error;

static boost::log::trivial::severity_level level_to_boost(unsigned level)
{
    switch (level) {
    // Report fatal errors only.
    case 0: return boost::log::trivial::fatal;
    // Report fatal errors and errors.
    case 1: return boost::log::trivial::error;
    // Report fatal errors, errors and warnings.
    case 2: return boost::log::trivial::warning;
    // Report all errors, warnings and infos.
    case 3: return boost::log::trivial::info;
    // Report all errors, warnings, infos and debugging.
    case 4: return boost::log::trivial::debug;
    // Report everyting including fine level tracing information.
    default: return boost::log::trivial::trace;
    }
}

void set_logging_level(unsigned int level)
{
    logSeverity = level_to_boost(level);

    boost::log::core::get()->set_filter
    (
        boost::log::trivial::severity >= logSeverity
    );
}

unsigned int level_string_to_boost(std::string level)
{
    static const std::map<std::string, unsigned int> levels = {
        { "fatal",   0 },
        { "error",   1 },
        { "warning", 2 },
        { "info",    3 },
        { "debug",   4 },
        { "trace",   5 },
    };
    boost::algorithm::to_lower(level);
    auto it = levels.find(level);
    return it == levels.end() ? 1 : it->second;
}

std::string get_string_logging_level(unsigned level)
{
    switch (level) {
    case 0: return "fatal";
    case 1: return "error";
    case 2: return "warning";
    case 3: return "info";
    case 4: return "debug";
    case 5: return "trace";
    default: return "error";
    }
}

unsigned get_logging_level()
{
    switch (logSeverity) {
    case boost::log::trivial::fatal : return 0;
    case boost::log::trivial::error : return 1;
    case boost::log::trivial::warning : return 2;
    case boost::log::trivial::info : return 3;
    case boost::log::trivial::debug : return 4;
    case boost::log::trivial::trace : return 5;
    default: return 1;
    }
}

boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> g_log_sink;

// Keep the library quiet (warnings and worse) until the application picks a level.
static struct RunOnInit {
    RunOnInit() {
        set_logging_level(2);
    }
} g_RunOnInit;

static std::string g_data_dir;

void set_data_dir(const std::string &dir)
{
    boost::system::error_code ec;
    if (!dir.empty() && !boost::filesystem::is_directory(dir, ec)) {
        boost::filesystem::create_directories(dir, ec);
        if (ec)
            throw FileIOError("Cannot create the data directory " + dir + ": " + ec.message());
    }
    g_data_dir = dir;
}

const std::string& data_dir()
{
    return g_data_dir;
}

std::string format_memsize(size_t bytes, unsigned int decimals)
{
    static constexpr const char *units[] = { "B", "KB", "MB", "GB" };
    double value = double(bytes);
    size_t unit  = 0;
    while (value >= 1024. && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.;
        ++ unit;
    }
    char buf[64];
    if (unit == 0)
        snprintf(buf, sizeof(buf), "%zu %s", bytes, units[unit]);
    else
        snprintf(buf, sizeof(buf), "%.*f %s", int(decimals), value, units[unit]);
    return buf;
}

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
namespace attrs = boost::log::attributes;
void set_log_path_and_level(const std::string& file, unsigned int level)
{
	// log file at <data_dir>/log/<file>.<N>
	auto log_folder = boost::filesystem::path(g_data_dir) / "log";
	boost::system::error_code ec;
	if (!boost::filesystem::is_directory(log_folder, ec)) {
		boost::filesystem::create_directories(log_folder, ec);
		if (ec)
			throw FileIOError("Cannot create the log directory " + log_folder.string() + ": " + ec.message());
	}
	auto full_path = (log_folder / file).make_preferred();

	g_log_sink = boost::log::add_file_log(
		keywords::file_name = full_path.string() + ".%N",
		keywords::rotation_size = 10 * 1024 * 1024,
		keywords::format =
		(
			expr::stream
			<< "[" << expr::attr< logging::trivial::severity_level >("Severity") << "]\t"
			<< expr::format_date_time< boost::posix_time::ptime >("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
			<<"[Thread " << expr::attr<attrs::current_thread_id::value_type>("ThreadID") << "]"
			<< ":" << expr::smessage
		)
	);

	logging::add_common_attributes();

	set_logging_level(level);
}

void flush_logs()
{
	if (g_log_sink)
		g_log_sink->flush();
}

} // namespace ForgeLink
