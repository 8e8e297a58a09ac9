#ifndef forgelink_Discovery_hpp_
#define forgelink_Discovery_hpp_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ControlSession.hpp"
#include "PrinterTypes.hpp"
#include "Transport.hpp"

namespace ForgeLink {

struct DiscoveryTarget
{
    std::string     address;
    unsigned short  port = 0;
};

struct DiscoveryParams
{
    std::vector<DiscoveryTarget> targets {
        { DISCOVERY_MULTICAST_ADDR, DISCOVERY_MULTICAST_PORT },
        { DISCOVERY_BROADCAST_ADDR, DISCOVERY_BROADCAST_PORT },
    };
    // Probes sent to every target, clamped to 1..3.
    int probe_count = 1;
};

// Finds printers on the local network.
//
// A 16 byte zero probe is sent to each target; every printer answers from its own address
// with a fixed size identification record:
//
//     0x00 .. 0x20   machine name, NUL padded
//     0x92 .. 0xB2   serial number, NUL padded
//
// Records shorter than 0xC4 bytes or without a serial are ignored.
class PrinterDiscovery
{
public:
    static constexpr size_t PROBE_SIZE          = 16;
    static constexpr size_t REPLY_MIN_SIZE      = 0xC4;
    static constexpr size_t NAME_OFFSET         = 0x00;
    static constexpr size_t NAME_LENGTH         = 0x20;
    static constexpr size_t SERIAL_OFFSET       = 0x92;
    static constexpr size_t SERIAL_LENGTH       = 0x20;

    explicit PrinterDiscovery(std::shared_ptr<Transport> transport, DiscoveryParams params = DiscoveryParams());

    // Listen for replies until timeout expires. One descriptor per serial, the latest reply wins.
    // An empty result is not an error. Throws ConnectionError if no probe could be sent.
    std::vector<PrinterDescriptor> discover(Milliseconds timeout) const;
    // discover() followed by an M115 query of every printer found. A printer which cannot be
    // queried keeps its discovery descriptor.
    std::vector<PrinterDescriptor> discover_with_info(Milliseconds timeout, const SessionParams &session_params = SessionParams()) const;

    static std::string                      probe_payload() { return std::string(PROBE_SIZE, '\0'); }
    static std::optional<PrinterDescriptor> parse_reply(const Datagram &datagram);

private:
    std::shared_ptr<Transport>  m_transport;
    DiscoveryParams             m_params;
};

} // namespace ForgeLink

#endif /* forgelink_Discovery_hpp_ */
