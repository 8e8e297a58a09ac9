#ifndef forgelink_Dashboard_hpp_
#define forgelink_Dashboard_hpp_

#include <memory>
#include <optional>
#include <string>

#include "CameraProbe.hpp"
#include "ControlSession.hpp"
#include "Discovery.hpp"
#include "PrinterTypes.hpp"

namespace ForgeLink {

struct DashboardParams
{
    Milliseconds    discovery_timeout { 3000 };
    // Query M115 in the status branch.
    bool            query_info = true;
};

// Everything known about one printer at one point in time. A branch which failed
// leaves its value empty and records the reason in the matching *_error field.
struct DashboardView
{
    PrinterDescriptor               descriptor;
    std::optional<MachineStatus>    status;
    std::string                     status_error;
    std::optional<PrinterInfo>      info;
    std::string                     info_error;
    CameraProbeResult               camera;
};

// Combined status and camera check of a single printer.
class Dashboard
{
public:
    Dashboard(std::shared_ptr<Transport> transport,
              DiscoveryParams            discovery_params = DiscoveryParams(),
              SessionParams              session_params   = SessionParams(),
              CameraProbeParams          camera_params    = CameraProbeParams(),
              DashboardParams            params           = DashboardParams());

    // Without a printer, discovery has to find exactly one: throws NoDeviceFoundError
    // or AmbiguousDeviceError. The status read and the camera probe run concurrently.
    DashboardView watch(const std::optional<PrinterDescriptor> &printer = std::nullopt) const;

    // The single printer on the network.
    PrinterDescriptor select_printer() const;

private:
    void read_status(DashboardView &view) const;

    std::shared_ptr<Transport>  m_transport;
    DiscoveryParams             m_discovery_params;
    SessionParams               m_session_params;
    CameraProbeParams           m_camera_params;
    DashboardParams             m_params;
};

} // namespace ForgeLink

#endif /* forgelink_Dashboard_hpp_ */
