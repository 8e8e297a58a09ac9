#ifndef forgelink_ControlSession_hpp_
#define forgelink_ControlSession_hpp_

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <boost/core/noncopyable.hpp>

#include "PrinterTypes.hpp"
#include "Transport.hpp"

namespace ForgeLink {

struct SessionParams
{
    Milliseconds connect_timeout { 5000 };
    // Bound on a whole request / reply exchange.
    Milliseconds read_timeout    { 5000 };
};

// Control connection to one printer on its TCP control port.
//
// Commands are strictly sequential: one request, one reply frame. A command issued while another
// one waits for its reply, or while an upload holds the TransferLease, fails with SessionBusyError.
// A transport failure moves the session to ConnectionState::Failed and drops the socket;
// the session stays unusable until reconnect().
class ControlSession : private boost::noncopyable
{
public:
    ControlSession(std::shared_ptr<Transport> transport, PrinterDescriptor descriptor, SessionParams params = SessionParams());
    ~ControlSession();

    // Construct and open a session.
    static std::unique_ptr<ControlSession> connect(std::shared_ptr<Transport> transport, const PrinterDescriptor &descriptor, const SessionParams &params = SessionParams());

    // Connect and take control of the printer (M601 S1).
    // Throws ConnectionError, TimeoutError, or RemoteRejectedError if the printer refuses control.
    void open();
    // close() followed by open().
    void reconnect();
    // Release control (M602, best effort) and close the socket. Idempotent.
    // Throws SessionBusyError while a command waits for its reply or a transfer holds the lease.
    void close();

    // M119 + M105, and M27 while printing.
    MachineStatus   status();
    // M115
    PrinterInfo     info();
    // M23, select a file already stored in the user folder and print it.
    void            start_print(const std::string &remote_file_name);
    // Raw exchange, returns the whole reply frame.
    std::string     send_command(const std::string &command);

    const PrinterDescriptor&    descriptor() const { return m_descriptor; }
    const SessionParams&        params() const { return m_params; }
    ConnectionState             connection_state() const;
    std::optional<std::string>  last_error() const;

    // Exclusive hold on the control link for the duration of a file transfer.
    // Throws SessionBusyError if a command or another lease is active,
    // ConnectionError if the session is not connected.
    class TransferLease : private boost::noncopyable
    {
    public:
        explicit TransferLease(ControlSession &session);
        ~TransferLease();

        std::string     command(const std::string &command);
        // Raw bytes, not framed.
        void            write(const std::string &data);
        // The link is out of step after a broken transfer: fail the session.
        void            abort(const std::string &reason);
        ControlSession& session() { return m_session; }

    private:
        ControlSession &m_session;
    };

private:
    class CommandGuard;

    std::string transact(const std::string &command);
    void        write_raw(const std::string &data);
    void        fail(const std::string &message);
    // close() without the busy check.
    void        release_channel();
    void        require_connected() const;

    std::shared_ptr<Transport>          m_transport;
    PrinterDescriptor                   m_descriptor;
    SessionParams                       m_params;

    std::unique_ptr<StreamChannel>      m_channel;
    // Bytes received past the end of the last reply frame.
    std::string                         m_pending;

    // Guards the state below.
    mutable std::mutex                  m_mutex;
    ConnectionState                     m_state  = ConnectionState::Disconnected;
    std::optional<std::string>          m_last_error;
    bool                                m_busy   = false;
    bool                                m_leased = false;
};

} // namespace ForgeLink

#endif /* forgelink_ControlSession_hpp_ */
