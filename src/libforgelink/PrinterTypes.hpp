#ifndef forgelink_PrinterTypes_hpp_
#define forgelink_PrinterTypes_hpp_

#include <ctime>
#include <optional>
#include <ostream>
#include <string>

#include "libforgelink.h"

namespace ForgeLink {

// Machine state as reported by M119.
enum class DeviceState {
    Idle,
    Printing,
    Paused,
    Error,
    Unknown
};

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

const char* to_string(DeviceState state);
const char* to_string(ConnectionState state);

// Answer to M115.
struct PrinterInfo
{
    std::string model;
    std::string name;
    std::string firmware_version;
    std::string serial_number;
    std::string mac_address;
    int         tool_count = 0;
    // Build volume in millimeters, zero if the firmware did not report it.
    double      build_x = 0.;
    double      build_y = 0.;
    double      build_z = 0.;
};

// Identity of a reachable printer. A value type, never modified once produced by discovery;
// a fresher reply for the same serial replaces it.
struct PrinterDescriptor
{
    std::string     serial_number;
    std::string     name;
    std::string     ip_address;
    std::string     model;
    std::string     firmware_version;
    unsigned short  control_port  = CONTROL_PORT;
    // UTC
    time_t          discovered_at = 0;

    // Descriptor for a printer given by address, bypassing discovery.
    // The address stands in for the serial until info() reports the real one.
    static PrinterDescriptor from_address(const std::string &ip_address, unsigned short control_port = CONTROL_PORT);

    // Copy of this descriptor completed with the identification reported by M115.
    PrinterDescriptor with_info(const PrinterInfo &info) const;

    std::string display_name() const { return name.empty() ? "FlashForge@" + ip_address : name; }
};

std::ostream& operator<<(std::ostream &os, const PrinterDescriptor &printer);

// Snapshot of the printer state, created fresh on every poll.
struct MachineStatus
{
    DeviceState                 state               = DeviceState::Unknown;
    // Token reported by the firmware, e.g. "BUILDING_FROM_SD".
    std::string                 raw_state;
    double                      nozzle_temp_current = 0.;
    double                      nozzle_temp_target  = 0.;
    double                      bed_temp_current    = 0.;
    double                      bed_temp_target     = 0.;
    // Progress and layer counters are zero unless state == Printing.
    double                      progress_percent    = 0.;
    int                         current_layer       = 0;
    int                         total_layers        = 0;
    long long                   bytes_printed       = 0;
    long long                   bytes_total         = 0;
    bool                        moving              = false;
    std::optional<std::string>  active_file_name;

    bool is_printing() const { return state == DeviceState::Printing; }
};

struct CameraProbeResult
{
    std::string                 stream_url;
    std::string                 snapshot_url;
    bool                        available = false;
    int                         attempts  = 0;
    std::optional<long long>    last_latency_ms;
    // Reason of the last failed attempt, empty if available.
    std::string                 error;
};

} // namespace ForgeLink

#endif /* forgelink_PrinterTypes_hpp_ */
