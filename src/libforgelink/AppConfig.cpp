#include "AppConfig.hpp"
#include "Exception.hpp"
#include "Utils.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>
#include <boost/nowide/cstdlib.hpp>
#include <boost/nowide/fstream.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace ForgeLink {

namespace {

struct Setting
{
    const char *section;
    const char *key;
    const char *env;
    const char *default_value;
};

static const Setting SETTINGS[] = {
    { "network",   "printer_ip",                     "FORGELINK_PRINTER_IP",                     ""      },
    { "network",   "control_port",                   "FORGELINK_CONTROL_PORT",                   "8899"  },
    { "network",   "connect_timeout_ms",             "FORGELINK_CONNECT_TIMEOUT_MS",             "5000"  },
    { "network",   "read_timeout_ms",                "FORGELINK_READ_TIMEOUT_MS",                "5000"  },
    { "discovery", "discovery_timeout_ms",           "FORGELINK_DISCOVERY_TIMEOUT_MS",           "5000"  },
    { "discovery", "dashboard_discovery_timeout_ms", "FORGELINK_DASHBOARD_DISCOVERY_TIMEOUT_MS", "3000"  },
    { "camera",    "camera_attempts",                "FORGELINK_CAMERA_ATTEMPTS",                "4"     },
    { "camera",    "camera_base_delay_ms",           "FORGELINK_CAMERA_BASE_DELAY_MS",           "500"   },
    { "camera",    "camera_max_wait_ms",             "FORGELINK_CAMERA_MAX_WAIT_MS",             "10000" },
    { "camera",    "camera_timeout_ms",              "FORGELINK_CAMERA_TIMEOUT_MS",              "3000"  },
    { "log",       "log_level",                      "FORGELINK_LOGLEVEL",                       "2"     },
};

} // namespace

void AppConfig::reset()
{
    m_storage.clear();
    set_defaults();
}

void AppConfig::set_defaults()
{
    for (const Setting &setting : SETTINGS)
        if (! this->has(setting.section, setting.key))
            this->set(setting.section, setting.key, setting.default_value);
}

std::string AppConfig::environment_variable(const std::string &section, const std::string &key)
{
    for (const Setting &setting : SETTINGS)
        if (section == setting.section && key == setting.key)
            return setting.env;
    return std::string();
}

std::string AppConfig::load(const std::string &path)
{
    // 1) Read the complete config file into a boost::property_tree.
    namespace pt = boost::property_tree;
    pt::ptree tree;
    try {
        boost::nowide::ifstream ifs(path);
        if (! ifs)
            return "Cannot open configuration file " + path;
        pt::read_ini(ifs, tree);
    } catch (pt::ptree_error &ex) {
        BOOST_LOG_TRIVIAL(info) << boost::format("Failed to parse configuration file \"%1%\": %2%") % path % ex.what();
        return ex.what();
    }

    // 2) Parse the property_tree, extract the sections and key / value pairs.
    for (const auto &section : tree) {
        if (section.second.empty()) {
            // Top level entries without a section are not used.
            if (! section.second.data().empty())
                BOOST_LOG_TRIVIAL(warning) << "Ignoring \"" << section.first << "\" outside of a section in " << path;
            continue;
        }
        for (const auto &kvp : section.second) {
            if (environment_variable(section.first, kvp.first).empty())
                BOOST_LOG_TRIVIAL(warning) << "Unknown setting [" << section.first << "] " << kvp.first << " in " << path;
            m_storage[section.first][kvp.first] = kvp.second.data();
        }
    }

    // Override missing keys with their defaults.
    this->set_defaults();
    m_dirty = false;
    BOOST_LOG_TRIVIAL(debug) << "Loaded configuration from " << path;
    return std::string();
}

void AppConfig::save(const std::string &path)
{
    boost::nowide::ofstream c;
    c.open(path, std::ios::out | std::ios::trunc);
    if (! c)
        throw FileIOError("Cannot write configuration file " + path);
    c << "# " << FORGELINK_APP_NAME << " " << FORGELINK_VERSION << std::endl;
    for (const auto &section : m_storage) {
        c << std::endl << "[" << section.first << "]" << std::endl;
        for (const auto &kvp : section.second)
            c << kvp.first << " = " << kvp.second << std::endl;
    }
    c.close();
    if (c.fail())
        throw FileIOError("Writing configuration file " + path + " failed");
    m_dirty = false;
}

void AppConfig::load_environment()
{
    for (const Setting &setting : SETTINGS)
        if (const char *value = boost::nowide::getenv(setting.env); value != nullptr) {
            BOOST_LOG_TRIVIAL(debug) << setting.env << " overrides [" << setting.section << "] " << setting.key;
            this->set(setting.section, setting.key, value);
        }
}

long long AppConfig::get_int(const std::string &section, const std::string &key) const
{
    std::string value = this->get(section, key);
    boost::algorithm::trim(value);
    try {
        return boost::lexical_cast<long long>(value);
    } catch (const boost::bad_lexical_cast &) {
        throw ConfigError((boost::format("Invalid value \"%1%\" of %2% (%3%), an integer is expected") % value % key % environment_variable(section, key)).str());
    }
}

static long long checked_range(long long value, long long min, long long max, const char *key)
{
    if (value < min || value > max)
        throw ConfigError((boost::format("%1% = %2% is out of range %3%..%4%") % key % value % min % max).str());
    return value;
}

unsigned short AppConfig::control_port() const
{
    return (unsigned short)checked_range(this->get_int("network", "control_port"), 1, 65535, "control_port");
}

unsigned int AppConfig::log_level() const
{
    // Severity names are accepted as well, e.g. FORGELINK_LOGLEVEL=debug
    std::string value = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(this->get("log", "log_level")));
    if (! value.empty() && value.find_first_not_of("0123456789") != std::string::npos) {
        const unsigned int level = level_string_to_boost(value);
        if (get_string_logging_level(level) != value)
            throw ConfigError("Unknown log level \"" + value + "\" (FORGELINK_LOGLEVEL)");
        return level;
    }
    return (unsigned int)checked_range(this->get_int("log", "log_level"), 0, 5, "log_level");
}

SessionParams AppConfig::session_params() const
{
    SessionParams params;
    params.connect_timeout = Milliseconds(checked_range(this->get_int("network", "connect_timeout_ms"), 1, 600000, "connect_timeout_ms"));
    params.read_timeout    = Milliseconds(checked_range(this->get_int("network", "read_timeout_ms"), 1, 600000, "read_timeout_ms"));
    return params;
}

DiscoveryParams AppConfig::discovery_params() const
{
    return DiscoveryParams();
}

Milliseconds AppConfig::discovery_timeout() const
{
    return Milliseconds(checked_range(this->get_int("discovery", "discovery_timeout_ms"), 0, 600000, "discovery_timeout_ms"));
}

CameraProbeParams AppConfig::camera_params() const
{
    CameraProbeParams params;
    params.max_attempts    = int(checked_range(this->get_int("camera", "camera_attempts"), 1, 100, "camera_attempts"));
    params.base_delay      = Milliseconds(checked_range(this->get_int("camera", "camera_base_delay_ms"), 0, 600000, "camera_base_delay_ms"));
    params.max_total_wait  = Milliseconds(checked_range(this->get_int("camera", "camera_max_wait_ms"), 0, 3600000, "camera_max_wait_ms"));
    params.attempt_timeout = Milliseconds(checked_range(this->get_int("camera", "camera_timeout_ms"), 1, 600000, "camera_timeout_ms"));
    return params;
}

DashboardParams AppConfig::dashboard_params() const
{
    DashboardParams params;
    params.discovery_timeout = Milliseconds(checked_range(this->get_int("discovery", "dashboard_discovery_timeout_ms"), 0, 600000, "dashboard_discovery_timeout_ms"));
    return params;
}

} // namespace ForgeLink
