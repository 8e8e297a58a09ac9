#include "AsioTransport.hpp"
#include "Exception.hpp"

#include <array>

#include <boost/asio.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace ForgeLink {

namespace asio = boost::asio;
using boost::asio::ip::tcp;
using boost::asio::ip::udp;

static constexpr size_t RECEIVE_BUFFER_SIZE = 4096;

namespace {

class AsioStreamChannel : public StreamChannel
{
public:
    AsioStreamChannel() : m_socket(m_io), m_resolver(m_io) {}
    ~AsioStreamChannel() override { this->close(); }

    void connect(const std::string &host, unsigned short port, Milliseconds timeout)
    {
        boost::system::error_code ec = asio::error::would_block;
        m_resolver.async_resolve(host, std::to_string(port),
            [this, &ec](const boost::system::error_code &resolve_ec, tcp::resolver::results_type results) {
                if (resolve_ec) {
                    ec = resolve_ec;
                    return;
                }
                asio::async_connect(m_socket, results,
                    [&ec](const boost::system::error_code &connect_ec, const tcp::endpoint &) { ec = connect_ec; });
            });

        if (! this->run(deadline_after(timeout)))
            throw ConnectionError((boost::format("Connecting to %1%:%2% timed out after %3% ms") % host % port % timeout.count()).str());
        if (ec) {
            this->close();
            throw ConnectionError((boost::format("Connecting to %1%:%2% failed: %3%") % host % port % ec.message()).str());
        }
        boost::system::error_code ignored;
        m_socket.set_option(tcp::no_delay(true), ignored);
        BOOST_LOG_TRIVIAL(debug) << "Connected to " << host << ":" << port;
    }

    void write(const std::string &data, Deadline deadline) override
    {
        if (! m_socket.is_open())
            throw ConnectionError("Write on a closed connection");
        boost::system::error_code ec = asio::error::would_block;
        asio::async_write(m_socket, asio::buffer(data),
            [&ec](const boost::system::error_code &write_ec, size_t) { ec = write_ec; });
        if (! this->run(deadline))
            throw TimeoutError("Timed out while sending to the printer");
        if (ec) {
            this->close();
            throw ConnectionError("Sending to the printer failed: " + ec.message());
        }
    }

    std::string read_some(Deadline deadline) override
    {
        if (! m_socket.is_open())
            throw ConnectionError("Read on a closed connection");
        boost::system::error_code ec = asio::error::would_block;
        size_t                    received = 0;
        m_socket.async_read_some(asio::buffer(m_buffer),
            [&ec, &received](const boost::system::error_code &read_ec, size_t n) { ec = read_ec; received = n; });
        if (! this->run(deadline))
            throw TimeoutError("Timed out waiting for the printer to reply");
        if (ec) {
            this->close();
            if (ec == asio::error::eof)
                throw ConnectionError("Connection closed by the printer");
            throw ConnectionError("Receiving from the printer failed: " + ec.message());
        }
        return std::string(m_buffer.data(), received);
    }

    void close() override
    {
        if (! m_socket.is_open())
            return;
        boost::system::error_code ignored;
        m_socket.shutdown(tcp::socket::shutdown_both, ignored);
        m_socket.close(ignored);
    }

    bool is_open() const override { return m_socket.is_open(); }

private:
    // Run the pending operation until it completes or the deadline passes.
    // On timeout the socket is closed and the aborted handlers are drained; returns false.
    bool run(Deadline deadline)
    {
        m_io.restart();
        m_io.run_until(deadline);
        if (m_io.stopped())
            return true;
        m_resolver.cancel();
        boost::system::error_code ignored;
        m_socket.close(ignored);
        m_io.run();
        return false;
    }

    asio::io_context                        m_io;
    tcp::socket                             m_socket;
    tcp::resolver                           m_resolver;
    std::array<char, RECEIVE_BUFFER_SIZE>   m_buffer;
};

class AsioDatagramChannel : public DatagramChannel
{
public:
    AsioDatagramChannel() : m_socket(m_io)
    {
        boost::system::error_code ec;
        m_socket.open(udp::v4(), ec);
        if (! ec) m_socket.set_option(asio::socket_base::broadcast(true), ec);
        if (! ec) m_socket.set_option(asio::socket_base::reuse_address(true), ec);
        if (! ec) m_socket.set_option(asio::ip::multicast::hops(4), ec);
        if (! ec) m_socket.bind(udp::endpoint(udp::v4(), 0), ec);
        if (ec)
            throw ConnectionError("Cannot open the discovery socket: " + ec.message());
    }
    ~AsioDatagramChannel() override
    {
        boost::system::error_code ignored;
        m_socket.close(ignored);
    }

    void send_to(const std::string &payload, const std::string &address, unsigned short port) override
    {
        boost::system::error_code ec;
        const asio::ip::address target = asio::ip::make_address(address, ec);
        if (ec)
            throw ConnectionError("Invalid discovery address " + address);
        m_socket.send_to(asio::buffer(payload), udp::endpoint(target, port), 0, ec);
        if (ec)
            throw ConnectionError((boost::format("Sending the discovery probe to %1%:%2% failed: %3%") % address % port % ec.message()).str());
    }

    std::optional<Datagram> receive(Deadline deadline) override
    {
        boost::system::error_code ec = asio::error::would_block;
        size_t                    received = 0;
        m_socket.async_receive_from(asio::buffer(m_buffer), m_sender,
            [&ec, &received](const boost::system::error_code &recv_ec, size_t n) { ec = recv_ec; received = n; });

        m_io.restart();
        m_io.run_until(deadline);
        if (! m_io.stopped()) {
            // Keep the socket, only abort the pending receive.
            boost::system::error_code ignored;
            m_socket.cancel(ignored);
            m_io.run();
            return std::nullopt;
        }
        if (ec)
            throw ConnectionError("Receiving discovery replies failed: " + ec.message());

        Datagram datagram;
        datagram.payload        = std::string(m_buffer.data(), received);
        datagram.sender_address = m_sender.address().to_string();
        datagram.sender_port    = m_sender.port();
        return datagram;
    }

private:
    asio::io_context                        m_io;
    udp::socket                             m_socket;
    udp::endpoint                           m_sender;
    std::array<char, RECEIVE_BUFFER_SIZE>   m_buffer;
};

} // namespace

std::unique_ptr<DatagramChannel> AsioTransport::open_datagram()
{
    return std::make_unique<AsioDatagramChannel>();
}

std::unique_ptr<StreamChannel> AsioTransport::connect(const std::string &host, unsigned short port, Milliseconds timeout)
{
    auto channel = std::make_unique<AsioStreamChannel>();
    channel->connect(host, port, timeout);
    return channel;
}

} // namespace ForgeLink
