#include "Discovery.hpp"
#include "Exception.hpp"
#include "Time.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <map>

#include <boost/log/trivial.hpp>

namespace ForgeLink {

PrinterDiscovery::PrinterDiscovery(std::shared_ptr<Transport> transport, DiscoveryParams params)
    : m_transport(std::move(transport))
    , m_params(std::move(params))
{
    m_params.probe_count = std::clamp(m_params.probe_count, 1, 3);
}

std::optional<PrinterDescriptor> PrinterDiscovery::parse_reply(const Datagram &datagram)
{
    const std::string &data = datagram.payload;
    if (data.size() < REPLY_MIN_SIZE) {
        BOOST_LOG_TRIVIAL(debug) << "Ignoring a discovery reply of " << data.size() << " bytes from " << datagram.sender_address;
        return std::nullopt;
    }
    PrinterDescriptor printer;
    printer.serial_number = trim_fixed_field(data.substr(SERIAL_OFFSET, SERIAL_LENGTH));
    if (printer.serial_number.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "Ignoring a discovery reply without serial number from " << datagram.sender_address;
        return std::nullopt;
    }
    printer.name = trim_fixed_field(data.substr(NAME_OFFSET, NAME_LENGTH));
    if (printer.name.empty())
        printer.name = "FlashForge@" + datagram.sender_address;
    printer.ip_address    = datagram.sender_address;
    printer.discovered_at = Utils::get_current_time_utc();
    return printer;
}

std::vector<PrinterDescriptor> PrinterDiscovery::discover(Milliseconds timeout) const
{
    const Deadline                   deadline = deadline_after(timeout);
    std::unique_ptr<DatagramChannel> channel  = m_transport->open_datagram();

    const std::string probe  = probe_payload();
    size_t            sent   = 0;
    std::string       last_error;
    for (int i = 0; i < m_params.probe_count; ++ i)
        for (const DiscoveryTarget &target : m_params.targets) {
            try {
                channel->send_to(probe, target.address, target.port);
                ++ sent;
            } catch (const ConnectionError &ex) {
                BOOST_LOG_TRIVIAL(warning) << ex.what();
                last_error = ex.what();
            }
        }
    if (sent == 0)
        throw ConnectionError(last_error.empty() ? std::string("No discovery target configured") : last_error);

    std::map<std::string, PrinterDescriptor> printers;
    while (std::optional<Datagram> datagram = channel->receive(deadline)) {
        std::optional<PrinterDescriptor> printer = parse_reply(*datagram);
        if (! printer)
            continue;
        BOOST_LOG_TRIVIAL(debug) << "Discovered " << *printer;
        std::string serial = printer->serial_number;
        printers.insert_or_assign(std::move(serial), std::move(*printer));
    }

    std::vector<PrinterDescriptor> out;
    out.reserve(printers.size());
    for (auto &kvp : printers)
        out.emplace_back(std::move(kvp.second));
    BOOST_LOG_TRIVIAL(info) << "Discovery found " << out.size() << " printer(s)";
    return out;
}

std::vector<PrinterDescriptor> PrinterDiscovery::discover_with_info(Milliseconds timeout, const SessionParams &session_params) const
{
    std::vector<PrinterDescriptor> printers = this->discover(timeout);
    for (PrinterDescriptor &printer : printers) {
        try {
            std::unique_ptr<ControlSession> session = ControlSession::connect(m_transport, printer, session_params);
            const PrinterInfo info = session->info();
            session->close();
            printer = printer.with_info(info);
        } catch (const Exception &ex) {
            BOOST_LOG_TRIVIAL(warning) << "Cannot query " << printer << ": " << ex.what();
        }
    }
    return printers;
}

} // namespace ForgeLink
