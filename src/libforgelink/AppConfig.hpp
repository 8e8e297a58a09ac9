#ifndef forgelink_AppConfig_hpp_
#define forgelink_AppConfig_hpp_

#include <map>
#include <string>

#include "CameraProbe.hpp"
#include "ControlSession.hpp"
#include "Dashboard.hpp"
#include "Discovery.hpp"

namespace ForgeLink {

// Settings of the command line tool, stored as [section] key = value.
// Defaults are overridden by forgelink.ini, which is overridden by FORGELINK_* environment variables.
// Components never read this object, they receive the parameter structs built from it.
class AppConfig
{
public:
    explicit AppConfig() : m_dirty(false) { this->reset(); }

    // Clear and reset to defaults.
    void                reset();
    // Override missing keys with their defaults.
    void                set_defaults();

    // Load an INI file. Returns an error message, empty on success.
    std::string         load(const std::string &path);
    // Store into an INI file. Throws FileIOError.
    void                save(const std::string &path);
    // Apply the FORGELINK_* environment variables on top of the current values.
    void                load_environment();

    // Does this config need to be saved?
    bool                dirty() const { return m_dirty; }

    // Const accessor, it will return false if a section or a key does not exist.
    bool get(const std::string &section, const std::string &key, std::string &value) const
    {
        value.clear();
        auto it = m_storage.find(section);
        if (it == m_storage.end())
            return false;
        auto it2 = it->second.find(key);
        if (it2 == it->second.end())
            return false;
        value = it2->second;
        return true;
    }
    std::string         get(const std::string &section, const std::string &key) const
        { std::string value; this->get(section, key, value); return value; }
    void                set(const std::string &section, const std::string &key, const std::string &value)
    {
        std::string &old = m_storage[section][key];
        if (old != value) {
            old = value;
            m_dirty = true;
        }
    }
    bool                has(const std::string &section, const std::string &key) const
    {
        auto it = m_storage.find(section);
        return it != m_storage.end() && it->second.find(key) != it->second.end();
    }

    // Throws ConfigError naming the key if the value is not an integer.
    long long           get_int(const std::string &section, const std::string &key) const;

    std::string         printer_ip() const { return this->get("network", "printer_ip"); }
    unsigned short      control_port() const;
    // 0 (fatal) .. 5 (trace), the value may also name the severity.
    unsigned int        log_level() const;

    SessionParams       session_params() const;
    DiscoveryParams     discovery_params() const;
    Milliseconds        discovery_timeout() const;
    CameraProbeParams   camera_params() const;
    DashboardParams     dashboard_params() const;

    // Name of the environment variable overriding section / key, empty if there is none.
    static std::string  environment_variable(const std::string &section, const std::string &key);

private:
    // Map of section, name -> value
    std::map<std::string, std::map<std::string, std::string>>  m_storage;
    // Has any value been modified since the config was loaded?
    bool                                                        m_dirty;
};

} // namespace ForgeLink

#endif /* forgelink_AppConfig_hpp_ */
