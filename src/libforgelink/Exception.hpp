#ifndef _libforgelink_Exception_h_
#define _libforgelink_Exception_h_

#include <stdexcept>

namespace ForgeLink {

// ForgeLink's own exception hierarchy is derived from std::runtime_error.
class Exception : public std::runtime_error { using std::runtime_error::runtime_error; };
#define FORGELINK_DERIVE_EXCEPTION(DERIVED_EXCEPTION, PARENT_EXCEPTION) \
    class DERIVED_EXCEPTION : public PARENT_EXCEPTION { using PARENT_EXCEPTION::PARENT_EXCEPTION; }
// Transport level failures. The caller may retry them.
FORGELINK_DERIVE_EXCEPTION(IOError,              Exception);
FORGELINK_DERIVE_EXCEPTION(ConnectionError,      IOError);
FORGELINK_DERIVE_EXCEPTION(TimeoutError,         IOError);
FORGELINK_DERIVE_EXCEPTION(UploadError,          IOError);
FORGELINK_DERIVE_EXCEPTION(FileIOError,          IOError);
// The printer answered with something we cannot parse. Retrying does not help.
FORGELINK_DERIVE_EXCEPTION(ProtocolError,        Exception);
// The printer understood the command and refused it. The message carries the reply verbatim.
FORGELINK_DERIVE_EXCEPTION(RemoteRejectedError,  Exception);
// Programming errors of the caller.
FORGELINK_DERIVE_EXCEPTION(LogicError,           Exception);
FORGELINK_DERIVE_EXCEPTION(SessionBusyError,     LogicError);
FORGELINK_DERIVE_EXCEPTION(ConfigError,          LogicError);
// Discovery could not pick a single printer.
FORGELINK_DERIVE_EXCEPTION(DeviceSelectionError, Exception);
FORGELINK_DERIVE_EXCEPTION(AmbiguousDeviceError, DeviceSelectionError);
FORGELINK_DERIVE_EXCEPTION(NoDeviceFoundError,   DeviceSelectionError);
#undef FORGELINK_DERIVE_EXCEPTION

} // namespace ForgeLink

#endif // _libforgelink_Exception_h_
