#ifndef forgelink_ReplyParser_hpp_
#define forgelink_ReplyParser_hpp_

#include <optional>
#include <string>

#include "PrinterTypes.hpp"

namespace ForgeLink {

// Framing and parsing of the FlashForge control port dialect.
//
// A request is "~<command>\r\n". The printer answers with
//
//     CMD M119 Received.
//     MachineStatus: BUILDING_FROM_SD
//     ...
//     ok
//
// The frame ends at the first line reading "ok", or at a line starting with "error".
// A refused handshake answers "Control failed." and may never send "ok", so that line ends the frame too.
// Parsers tolerate unknown lines and extra whitespace, but throw ProtocolError
// when a mandatory field is missing.
namespace ReplyParser {

std::string format_command(const std::string &command);
// First token of a command, e.g. "M28" for "M28 1024 0:/user/a.gx".
std::string command_code(const std::string &command);

enum class FrameEnd {
    Incomplete,
    Ok,
    Error
};

struct FrameScan
{
    FrameEnd end    = FrameEnd::Incomplete;
    // Number of bytes of the buffer belonging to the frame, including the terminating line.
    size_t   length = 0;
};

// Look for the end of the reply frame at the start of buffer. Only complete lines are considered.
FrameScan scan_reply_frame(const std::string &buffer);

// True if the frame holds nothing but the "ok" line. Every reply starts with the
// "CMD Mxxx Received." echo, so such a frame is the late trailer of an error frame.
bool is_bare_terminator(const std::string &frame);

// Throws ProtocolError if the reply echoes a command other than the one sent, which means the
// request / reply pairs went out of step.
void verify_reply_echo(const std::string &command, const std::string &reply);

// True if the reply carries a failure notice, e.g. "Control failed." or "open failed".
bool reply_reports_failure(const std::string &reply);

DeviceState device_state_from_token(const std::string &token);

// M119
struct StateReport
{
    DeviceState                 state = DeviceState::Unknown;
    std::string                 raw_state;
    bool                        moving = false;
    std::optional<std::string>  current_file;
};
StateReport parse_state_reply(const std::string &reply);

// M105
struct TemperatureReport
{
    double nozzle_current = 0.;
    double nozzle_target  = 0.;
    double bed_current    = 0.;
    double bed_target     = 0.;
};
TemperatureReport parse_temperature_reply(const std::string &reply);

// M27
struct ProgressReport
{
    long long bytes_printed = 0;
    long long bytes_total   = 0;
    int       current_layer = 0;
    int       total_layers  = 0;
};
ProgressReport parse_progress_reply(const std::string &reply);

// M115
PrinterInfo parse_info_reply(const std::string &reply);

// Merge the three replies of one poll. Progress is only taken into account while printing.
MachineStatus assemble_status(const StateReport &state, const TemperatureReport &temperatures, const std::optional<ProgressReport> &progress);

} // namespace ReplyParser
} // namespace ForgeLink

#endif /* forgelink_ReplyParser_hpp_ */
