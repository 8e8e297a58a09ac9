#ifndef _libforgelink_h_
#define _libforgelink_h_

#define FORGELINK_APP_NAME "ForgeLink"
#define FORGELINK_VERSION  "1.0.0"

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>

namespace ForgeLink {

// Well known FlashForge LAN endpoints.
static constexpr const char    *DISCOVERY_MULTICAST_ADDR = "225.0.0.9";
static constexpr unsigned short DISCOVERY_MULTICAST_PORT = 19000;
static constexpr const char    *DISCOVERY_BROADCAST_ADDR = "255.255.255.255";
static constexpr unsigned short DISCOVERY_BROADCAST_PORT = 48899;
static constexpr unsigned short CONTROL_PORT             = 8899;
static constexpr unsigned short CAMERA_PORT              = 8080;

// Files uploaded over the control port land in the printer's user folder.
static constexpr const char    *REMOTE_USER_DIR          = "0:/user/";

using Clock        = std::chrono::steady_clock;
using Deadline     = Clock::time_point;
using Milliseconds = std::chrono::milliseconds;

inline Deadline deadline_after(Milliseconds timeout) { return Clock::now() + timeout; }

} // namespace ForgeLink

#endif // _libforgelink_h_
