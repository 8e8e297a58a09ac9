#include "Dashboard.hpp"
#include "Exception.hpp"
#include "Thread.hpp"

#include <exception>
#include <sstream>

#include <boost/log/trivial.hpp>

namespace ForgeLink {

Dashboard::Dashboard(std::shared_ptr<Transport> transport, DiscoveryParams discovery_params, SessionParams session_params, CameraProbeParams camera_params, DashboardParams params)
    : m_transport(std::move(transport))
    , m_discovery_params(std::move(discovery_params))
    , m_session_params(session_params)
    , m_camera_params(std::move(camera_params))
    , m_params(params)
{}

PrinterDescriptor Dashboard::select_printer() const
{
    std::vector<PrinterDescriptor> printers = PrinterDiscovery(m_transport, m_discovery_params).discover(m_params.discovery_timeout);
    if (printers.empty())
        throw NoDeviceFoundError("No FlashForge printer found on the local network");
    if (printers.size() > 1) {
        std::ostringstream ss;
        ss << printers.size() << " printers found, select one by address:";
        for (const PrinterDescriptor &printer : printers)
            ss << "\n  " << printer;
        throw AmbiguousDeviceError(ss.str());
    }
    return printers.front();
}

void Dashboard::read_status(DashboardView &view) const
{
    ControlSession session(m_transport, view.descriptor, m_session_params);
    try {
        session.open();
    } catch (const Exception &ex) {
        view.status_error = ex.what();
        if (m_params.query_info)
            view.info_error = ex.what();
        return;
    }
    if (m_params.query_info) {
        try {
            view.info = session.info();
        } catch (const Exception &ex) {
            view.info_error = ex.what();
            // A broken link is reported by the status query as well.
            if (session.connection_state() == ConnectionState::Failed)
                session.reconnect();
        }
    }
    try {
        view.status = session.status();
    } catch (const Exception &ex) {
        view.status_error = ex.what();
    }
    session.close();
}

DashboardView Dashboard::watch(const std::optional<PrinterDescriptor> &printer) const
{
    DashboardView view;
    view.descriptor = printer ? *printer : this->select_printer();

    // Camera branch on a worker, status branch on the calling thread.
    CameraProbeResult  camera;
    std::exception_ptr camera_exception;
    boost::thread camera_thread = create_thread([this, &view, &camera, &camera_exception]() {
        try {
            camera = CameraProbe(m_transport, m_camera_params).probe(view.descriptor);
        } catch (const std::exception &) {
            camera_exception = std::current_exception();
        }
    });
    set_thread_name(camera_thread, "forgelink_cam");

    std::exception_ptr status_exception;
    try {
        this->read_status(view);
    } catch (const Exception &ex) {
        view.status_error = ex.what();
    } catch (const std::exception &) {
        status_exception = std::current_exception();
    }
    camera_thread.join();

    if (status_exception)
        std::rethrow_exception(status_exception);
    if (camera_exception)
        std::rethrow_exception(camera_exception);
    view.camera = std::move(camera);
    if (view.info)
        view.descriptor = view.descriptor.with_info(*view.info);
    return view;
}

} // namespace ForgeLink
