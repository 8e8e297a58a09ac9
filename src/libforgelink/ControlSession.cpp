#include "ControlSession.hpp"
#include "Exception.hpp"
#include "ReplyParser.hpp"
#include "Utils.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace ForgeLink {

// Marks the session busy for the duration of one public command.
class ControlSession::CommandGuard : private boost::noncopyable
{
public:
    explicit CommandGuard(ControlSession &session) : m_session(session)
    {
        std::lock_guard<std::mutex> lock(m_session.m_mutex);
        if (m_session.m_leased)
            throw SessionBusyError("A file transfer owns the control link of " + m_session.m_descriptor.display_name());
        if (m_session.m_busy)
            throw SessionBusyError("A command to " + m_session.m_descriptor.display_name() + " is still waiting for its reply");
        if (m_session.m_state != ConnectionState::Connected)
            throw ConnectionError((boost::format("Session to %1% is %2%%3%")
                % m_session.m_descriptor.display_name()
                % to_string(m_session.m_state)
                % (m_session.m_last_error ? ": " + *m_session.m_last_error : std::string())).str());
        m_session.m_busy = true;
    }
    ~CommandGuard()
    {
        std::lock_guard<std::mutex> lock(m_session.m_mutex);
        m_session.m_busy = false;
    }

private:
    ControlSession &m_session;
};

ControlSession::ControlSession(std::shared_ptr<Transport> transport, PrinterDescriptor descriptor, SessionParams params)
    : m_transport(std::move(transport))
    , m_descriptor(std::move(descriptor))
    , m_params(params)
{}

ControlSession::~ControlSession()
{
    this->release_channel();
}

std::unique_ptr<ControlSession> ControlSession::connect(std::shared_ptr<Transport> transport, const PrinterDescriptor &descriptor, const SessionParams &params)
{
    auto session = std::make_unique<ControlSession>(std::move(transport), descriptor, params);
    session->open();
    return session;
}

void ControlSession::open()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == ConnectionState::Connected)
            return;
        if (m_busy || m_leased)
            throw SessionBusyError("Cannot open a session which is in use");
        m_state = ConnectionState::Connecting;
        m_last_error.reset();
        // Keeps close() and commands from other threads off the channel during the handshake.
        m_busy = true;
    }
    ScopeGuard busy_guard([this]() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy = false;
    });
    m_pending.clear();

    BOOST_LOG_TRIVIAL(info) << "Connecting to " << m_descriptor.display_name() << " at " << m_descriptor.ip_address << ":" << m_descriptor.control_port;
    try {
        m_channel = m_transport->connect(m_descriptor.ip_address, m_descriptor.control_port, m_params.connect_timeout);
    } catch (const IOError &ex) {
        this->fail(ex.what());
        throw;
    }

    std::string reply;
    try {
        reply = this->transact("M601 S1");
    } catch (const RemoteRejectedError &ex) {
        this->fail(ex.what());
        throw;
    }
    if (ReplyParser::reply_reports_failure(reply)) {
        const std::string message = "Printer refused control: " + boost::algorithm::trim_copy(reply);
        this->fail(message);
        throw RemoteRejectedError(message);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_state = ConnectionState::Connected;
    BOOST_LOG_TRIVIAL(info) << "Control session to " << m_descriptor.display_name() << " established";
}

void ControlSession::reconnect()
{
    this->close();
    this->open();
}

void ControlSession::close()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_leased)
            throw SessionBusyError("Cannot close the session to " + m_descriptor.display_name() + " during a file transfer");
        if (m_busy)
            throw SessionBusyError("Cannot close the session to " + m_descriptor.display_name() + " while a command waits for its reply");
    }
    this->release_channel();
}

void ControlSession::release_channel()
{
    std::unique_ptr<StreamChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = std::move(m_channel);
        if (m_state != ConnectionState::Disconnected)
            BOOST_LOG_TRIVIAL(debug) << "Closing the session to " << m_descriptor.display_name();
        m_state = ConnectionState::Disconnected;
    }
    m_pending.clear();
    if (! channel)
        return;
    if (channel->is_open()) {
        try {
            channel->write(ReplyParser::format_command("M602"), deadline_after(m_params.read_timeout));
        } catch (const IOError &ex) {
            BOOST_LOG_TRIVIAL(debug) << "Releasing control of " << m_descriptor.display_name() << " failed: " << ex.what();
        }
    }
    channel->close();
}

ConnectionState ControlSession::connection_state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::optional<std::string> ControlSession::last_error() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_error;
}

MachineStatus ControlSession::status()
{
    CommandGuard guard(*this);
    const ReplyParser::StateReport       state        = ReplyParser::parse_state_reply(this->transact("M119"));
    const ReplyParser::TemperatureReport temperatures = ReplyParser::parse_temperature_reply(this->transact("M105"));
    std::optional<ReplyParser::ProgressReport> progress;
    if (state.state == DeviceState::Printing)
        progress = ReplyParser::parse_progress_reply(this->transact("M27"));
    return ReplyParser::assemble_status(state, temperatures, progress);
}

PrinterInfo ControlSession::info()
{
    CommandGuard guard(*this);
    return ReplyParser::parse_info_reply(this->transact("M115"));
}

void ControlSession::start_print(const std::string &remote_file_name)
{
    CommandGuard guard(*this);
    const std::string reply = this->transact("M23 " + std::string(REMOTE_USER_DIR) + remote_file_name);
    if (ReplyParser::reply_reports_failure(reply))
        throw RemoteRejectedError("Printer refused to start " + remote_file_name + ": " + boost::algorithm::trim_copy(reply));
    BOOST_LOG_TRIVIAL(info) << "Started printing " << remote_file_name << " on " << m_descriptor.display_name();
}

std::string ControlSession::send_command(const std::string &command)
{
    CommandGuard guard(*this);
    return this->transact(command);
}

void ControlSession::require_connected() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != ConnectionState::Connected)
        throw ConnectionError("Session to " + m_descriptor.display_name() + " is " + to_string(m_state));
}

// One request / reply exchange. The caller holds either the command guard or the transfer lease.
std::string ControlSession::transact(const std::string &command)
{
    if (! m_channel)
        throw ConnectionError("Session to " + m_descriptor.display_name() + " has no connection");
    if (! m_pending.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "Discarding " << m_pending.size() << " unsolicited bytes from " << m_descriptor.display_name();
        m_pending.clear();
    }

    BOOST_LOG_TRIVIAL(debug) << "-> " << m_descriptor.ip_address << ": " << command;
    const Deadline          deadline = deadline_after(m_params.read_timeout);
    ReplyParser::FrameScan  scan;
    try {
        m_channel->write(ReplyParser::format_command(command), deadline);
        for (;;) {
            scan = ReplyParser::scan_reply_frame(m_pending);
            if (scan.end == ReplyParser::FrameEnd::Incomplete) {
                m_pending += m_channel->read_some(deadline);
                continue;
            }
            if (scan.end == ReplyParser::FrameEnd::Ok && ReplyParser::is_bare_terminator(m_pending.substr(0, scan.length))) {
                // Trailer of an earlier error frame which arrived late.
                BOOST_LOG_TRIVIAL(debug) << "Dropping a stale ok from " << m_descriptor.display_name();
                m_pending.erase(0, scan.length);
                continue;
            }
            break;
        }
    } catch (const IOError &ex) {
        this->fail(ex.what());
        throw;
    }

    std::string reply = m_pending.substr(0, scan.length);
    m_pending.erase(0, scan.length);
    BOOST_LOG_TRIVIAL(trace) << "<- " << m_descriptor.ip_address << ": " << boost::algorithm::trim_copy(reply);

    if (scan.end == ReplyParser::FrameEnd::Error)
        throw RemoteRejectedError(boost::algorithm::trim_copy(reply));
    try {
        ReplyParser::verify_reply_echo(command, reply);
    } catch (const ProtocolError &ex) {
        // Replies can no longer be matched to requests.
        this->fail(ex.what());
        throw;
    }
    return reply;
}

void ControlSession::write_raw(const std::string &data)
{
    if (! m_channel)
        throw ConnectionError("Session to " + m_descriptor.display_name() + " has no connection");
    try {
        m_channel->write(data, deadline_after(m_params.read_timeout));
    } catch (const IOError &ex) {
        this->fail(ex.what());
        throw;
    }
}

void ControlSession::fail(const std::string &message)
{
    std::unique_ptr<StreamChannel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state      = ConnectionState::Failed;
        m_last_error = message;
        channel      = std::move(m_channel);
    }
    m_pending.clear();
    if (channel)
        channel->close();
    BOOST_LOG_TRIVIAL(error) << "Session to " << m_descriptor.display_name() << " failed: " << message;
}

ControlSession::TransferLease::TransferLease(ControlSession &session) : m_session(session)
{
    std::lock_guard<std::mutex> lock(m_session.m_mutex);
    if (m_session.m_leased || m_session.m_busy)
        throw SessionBusyError("The control link of " + m_session.m_descriptor.display_name() + " is in use");
    if (m_session.m_state != ConnectionState::Connected)
        throw ConnectionError("Session to " + m_session.m_descriptor.display_name() + " is " + to_string(m_session.m_state));
    m_session.m_leased = true;
}

ControlSession::TransferLease::~TransferLease()
{
    std::lock_guard<std::mutex> lock(m_session.m_mutex);
    m_session.m_leased = false;
}

std::string ControlSession::TransferLease::command(const std::string &command)
{
    m_session.require_connected();
    return m_session.transact(command);
}

void ControlSession::TransferLease::write(const std::string &data)
{
    m_session.require_connected();
    m_session.write_raw(data);
}

void ControlSession::TransferLease::abort(const std::string &reason)
{
    if (m_session.connection_state() == ConnectionState::Connected)
        m_session.fail(reason);
}

} // namespace ForgeLink
