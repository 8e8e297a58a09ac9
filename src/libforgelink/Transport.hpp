#ifndef forgelink_Transport_hpp_
#define forgelink_Transport_hpp_

#include <memory>
#include <optional>
#include <string>

#include "libforgelink.h"

namespace ForgeLink {

struct Datagram
{
    std::string     payload;
    std::string     sender_address;
    unsigned short  sender_port = 0;
};

// Unconnected UDP socket with broadcast enabled, bound to an ephemeral port.
class DatagramChannel
{
public:
    virtual ~DatagramChannel() = default;

    // Throws ConnectionError if the datagram cannot be sent.
    virtual void send_to(const std::string &payload, const std::string &address, unsigned short port) = 0;
    // Next datagram from any source, or nullopt once the deadline passes.
    virtual std::optional<Datagram> receive(Deadline deadline) = 0;
};

// Connected TCP stream. Every call is bounded by a deadline.
// Throws TimeoutError when the deadline passes and ConnectionError when the peer goes away;
// both leave the channel closed.
class StreamChannel
{
public:
    virtual ~StreamChannel() = default;

    virtual void        write(const std::string &data, Deadline deadline) = 0;
    // Returns at least one byte.
    virtual std::string read_some(Deadline deadline) = 0;
    // Idempotent.
    virtual void        close() = 0;
    virtual bool        is_open() const = 0;
};

// Factory of the channels above. The network facing implementation is AsioTransport,
// tests substitute scripted fakes. Implementations must allow channels to be opened
// from several threads at once.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual std::unique_ptr<DatagramChannel> open_datagram() = 0;
    // Throws ConnectionError if the TCP handshake does not complete within timeout.
    virtual std::unique_ptr<StreamChannel>   connect(const std::string &host, unsigned short port, Milliseconds timeout) = 0;
};

} // namespace ForgeLink

#endif /* forgelink_Transport_hpp_ */
