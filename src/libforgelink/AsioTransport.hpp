#ifndef forgelink_AsioTransport_hpp_
#define forgelink_AsioTransport_hpp_

#include "Transport.hpp"

namespace ForgeLink {

// Boost.Asio sockets. Each channel owns its io_context and runs it only for the
// duration of a blocking call, so channels may live on different threads.
class AsioTransport : public Transport
{
public:
    std::unique_ptr<DatagramChannel> open_datagram() override;
    std::unique_ptr<StreamChannel>   connect(const std::string &host, unsigned short port, Milliseconds timeout) override;
};

} // namespace ForgeLink

#endif /* forgelink_AsioTransport_hpp_ */
