#include "PrinterTypes.hpp"
#include "Time.hpp"

namespace ForgeLink {

const char* to_string(DeviceState state)
{
    switch (state) {
    case DeviceState::Idle:     return "idle";
    case DeviceState::Printing: return "printing";
    case DeviceState::Paused:   return "paused";
    case DeviceState::Error:    return "error";
    case DeviceState::Unknown:  return "unknown";
    }
    return "unknown";
}

const char* to_string(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    case ConnectionState::Failed:       return "failed";
    }
    return "failed";
}

PrinterDescriptor PrinterDescriptor::from_address(const std::string &ip_address, unsigned short control_port)
{
    PrinterDescriptor printer;
    printer.serial_number = ip_address;
    printer.ip_address    = ip_address;
    printer.control_port  = control_port;
    printer.discovered_at = Utils::get_current_time_utc();
    return printer;
}

PrinterDescriptor PrinterDescriptor::with_info(const PrinterInfo &info) const
{
    PrinterDescriptor out = *this;
    if (! info.serial_number.empty())
        out.serial_number = info.serial_number;
    if (! info.name.empty())
        out.name = info.name;
    out.model            = info.model;
    out.firmware_version = info.firmware_version;
    return out;
}

std::ostream& operator<<(std::ostream &os, const PrinterDescriptor &printer)
{
    os << printer.display_name();
    if (! printer.model.empty())
        os << " (" << printer.model << ")";
    os << " at " << printer.ip_address << ":" << printer.control_port;
    if (! printer.serial_number.empty() && printer.serial_number != printer.ip_address)
        os << " [" << printer.serial_number << "]";
    return os;
}

} // namespace ForgeLink
