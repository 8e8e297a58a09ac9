#include "ReplyParser.hpp"
#include "Exception.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <regex>

#include <boost/algorithm/string.hpp>
#include <boost/log/trivial.hpp>

namespace ForgeLink {
namespace ReplyParser {

static const std::regex re_echo       (R"(^CMD\s+(\S+)\s+Received)", std::regex::icase);
static const std::regex re_nozzle     (R"((?:^|\s)T0?\s*:\s*([-+]?\d+(?:\.\d+)?)\s*/\s*([-+]?\d+(?:\.\d+)?))", std::regex::icase);
static const std::regex re_bed        (R"((?:^|\s)B\s*:\s*([-+]?\d+(?:\.\d+)?)\s*/\s*([-+]?\d+(?:\.\d+)?))", std::regex::icase);
static const std::regex re_bytes      (R"(byte\s+(\d+)\s*/\s*(\d+))", std::regex::icase);
static const std::regex re_layer      (R"(layer\s*:\s*(\d+)\s*/\s*(\d+))", std::regex::icase);
static const std::regex re_build_size (R"(X\s*:\s*(\d+(?:\.\d+)?)\s+Y\s*:\s*(\d+(?:\.\d+)?)\s+Z\s*:\s*(\d+(?:\.\d+)?))", std::regex::icase);

namespace {

// "Key: value" lines of a reply, keys lower cased. Lines without a colon are skipped.
std::vector<std::pair<std::string, std::string>> key_values(const std::string &reply)
{
    std::vector<std::pair<std::string, std::string>> out;
    for (const std::string &line : split_reply_lines(reply)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos)
            continue;
        std::string key   = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(line.substr(0, colon)));
        std::string value = boost::algorithm::trim_copy(line.substr(colon + 1));
        out.emplace_back(std::move(key), std::move(value));
    }
    return out;
}

double to_double(const std::string &str, const char *field)
{
    try {
        return std::stod(str);
    } catch (const std::logic_error &) {
        throw ProtocolError(std::string("Invalid numeric value for ") + field + ": " + str);
    }
}

long long to_integer(const std::string &str, const char *field)
{
    try {
        return std::stoll(str);
    } catch (const std::logic_error &) {
        throw ProtocolError(std::string("Invalid integer value for ") + field + ": " + str);
    }
}

} // namespace

std::string format_command(const std::string &command)
{
    return "~" + boost::algorithm::trim_copy(command) + "\r\n";
}

std::string command_code(const std::string &command)
{
    std::string trimmed = boost::algorithm::trim_copy(command);
    if (! trimmed.empty() && trimmed.front() == '~')
        trimmed.erase(0, 1);
    return trimmed.substr(0, trimmed.find_first_of(" \t"));
}

FrameScan scan_reply_frame(const std::string &buffer)
{
    FrameScan scan;
    size_t    begin = 0;
    for (size_t eol = buffer.find('\n'); eol != std::string::npos; begin = eol + 1, eol = buffer.find('\n', begin)) {
        std::string line = boost::algorithm::trim_copy(buffer.substr(begin, eol - begin));
        if (boost::algorithm::iequals(line, "ok")) {
            scan.end = FrameEnd::Ok;
        } else if (boost::algorithm::istarts_with(line, "error") || boost::algorithm::icontains(line, "control failed")) {
            scan.end = FrameEnd::Error;
        } else
            continue;
        scan.length = eol + 1;
        return scan;
    }
    return scan;
}

bool is_bare_terminator(const std::string &frame)
{
    const std::vector<std::string> lines = split_reply_lines(frame);
    return lines.size() == 1 && boost::algorithm::iequals(lines.front(), "ok");
}

void verify_reply_echo(const std::string &command, const std::string &reply)
{
    std::smatch match;
    if (! std::regex_search(reply, match, re_echo))
        // Some replies carry no echo at all.
        return;
    const std::string expected = command_code(command);
    if (! boost::algorithm::iequals(match[1].str(), expected))
        throw ProtocolError("Reply to " + expected + " echoes " + match[1].str() + ", the command stream is out of step");
}

bool reply_reports_failure(const std::string &reply)
{
    for (const std::string &line : split_reply_lines(reply))
        if (boost::algorithm::icontains(line, "failed") || boost::algorithm::istarts_with(line, "error"))
            return true;
    return false;
}

DeviceState device_state_from_token(const std::string &token)
{
    const std::string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(token));
    if (upper == "BUILDING_FROM_SD" || upper == "BUILDING" || upper == "PRINTING")
        return DeviceState::Printing;
    if (upper == "PAUSED" || upper == "PAUSING")
        return DeviceState::Paused;
    if (upper == "READY" || upper == "IDLE" || upper == "COMPLETED" || upper == "BUILDING_COMPLETED")
        return DeviceState::Idle;
    if (upper == "ERROR")
        return DeviceState::Error;
    return DeviceState::Unknown;
}

StateReport parse_state_reply(const std::string &reply)
{
    StateReport report;
    bool        has_state = false;
    for (const auto &[key, value] : key_values(reply)) {
        if (key == "machinestatus" || key == "machine status") {
            if (value.empty())
                break;
            report.raw_state = value;
            report.state     = device_state_from_token(value);
            has_state        = true;
        } else if (key == "movemode" || key == "move mode") {
            report.moving = boost::algorithm::iequals(value, "MOVING");
        } else if (key == "currentfile" || key == "current file") {
            if (! value.empty())
                report.current_file = value;
        }
    }
    if (! has_state)
        throw ProtocolError("Status reply does not report the machine state");
    if (report.state == DeviceState::Unknown)
        BOOST_LOG_TRIVIAL(warning) << "Unrecognized machine state reported by the printer: " << report.raw_state;
    return report;
}

TemperatureReport parse_temperature_reply(const std::string &reply)
{
    TemperatureReport report;
    std::smatch       match;
    if (! std::regex_search(reply, match, re_nozzle))
        throw ProtocolError("Temperature reply does not report the nozzle temperature");
    report.nozzle_current = to_double(match[1].str(), "nozzle temperature");
    report.nozzle_target  = to_double(match[2].str(), "nozzle target");
    if (! std::regex_search(reply, match, re_bed))
        throw ProtocolError("Temperature reply does not report the bed temperature");
    report.bed_current = to_double(match[1].str(), "bed temperature");
    report.bed_target  = to_double(match[2].str(), "bed target");
    return report;
}

ProgressReport parse_progress_reply(const std::string &reply)
{
    ProgressReport report;
    std::smatch    match;
    if (! std::regex_search(reply, match, re_bytes))
        throw ProtocolError("Progress reply does not report the printed byte count");
    report.bytes_printed = to_integer(match[1].str(), "printed bytes");
    report.bytes_total   = to_integer(match[2].str(), "total bytes");
    // Older firmware does not report layers.
    if (std::regex_search(reply, match, re_layer)) {
        report.current_layer = int(to_integer(match[1].str(), "current layer"));
        report.total_layers  = int(to_integer(match[2].str(), "total layers"));
        if (report.current_layer > report.total_layers)
            throw ProtocolError("Progress reply reports layer " + match[1].str() + " of " + match[2].str());
    }
    return report;
}

PrinterInfo parse_info_reply(const std::string &reply)
{
    PrinterInfo info;
    for (const auto &[key, value] : key_values(reply)) {
        if (key == "machine type")
            info.model = value;
        else if (key == "machine name")
            info.name = value;
        else if (key == "firmware")
            info.firmware_version = value;
        else if (key == "sn" || key == "serial number")
            info.serial_number = value;
        else if (key == "mac address")
            info.mac_address = value;
        else if (key == "tool count")
            info.tool_count = int(to_integer(value, "tool count"));
    }
    std::smatch match;
    if (std::regex_search(reply, match, re_build_size)) {
        info.build_x = to_double(match[1].str(), "build volume X");
        info.build_y = to_double(match[2].str(), "build volume Y");
        info.build_z = to_double(match[3].str(), "build volume Z");
    }
    if (info.model.empty())
        throw ProtocolError("Info reply does not report the machine type");
    if (info.firmware_version.empty())
        throw ProtocolError("Info reply does not report the firmware version");
    if (info.serial_number.empty())
        throw ProtocolError("Info reply does not report the serial number");
    return info;
}

MachineStatus assemble_status(const StateReport &state, const TemperatureReport &temperatures, const std::optional<ProgressReport> &progress)
{
    MachineStatus status;
    status.state               = state.state;
    status.raw_state           = state.raw_state;
    status.moving              = state.moving;
    status.active_file_name    = state.current_file;
    status.nozzle_temp_current = temperatures.nozzle_current;
    status.nozzle_temp_target  = temperatures.nozzle_target;
    status.bed_temp_current    = temperatures.bed_current;
    status.bed_temp_target     = temperatures.bed_target;

    if (status.state == DeviceState::Printing) {
        if (! progress)
            throw ProtocolError("Print progress is missing for a printing machine");
        status.bytes_printed    = progress->bytes_printed;
        status.bytes_total      = progress->bytes_total;
        status.current_layer    = progress->current_layer;
        status.total_layers     = progress->total_layers;
        if (progress->bytes_total > 0)
            status.progress_percent = std::clamp(100. * double(progress->bytes_printed) / double(progress->bytes_total), 0., 100.);
    }
    return status;
}

} // namespace ReplyParser
} // namespace ForgeLink
