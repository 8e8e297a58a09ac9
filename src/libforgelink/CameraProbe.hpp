#ifndef forgelink_CameraProbe_hpp_
#define forgelink_CameraProbe_hpp_

#include <memory>
#include <string>

#include "PrinterTypes.hpp"
#include "Transport.hpp"

namespace ForgeLink {

struct CameraProbeParams
{
    int             max_attempts    = 4;
    Milliseconds    base_delay      { 500 };
    // Cap on the sum of the waits between attempts.
    Milliseconds    max_total_wait  { 10000 };
    Milliseconds    attempt_timeout { 3000 };
    unsigned short  port            = CAMERA_PORT;
    std::string     stream_path     = "/?action=stream";
    std::string     snapshot_path   = "/?action=snapshot";
};

// Checks that the printer's MJPEG streamer answers.
//
// The streamer is slow to answer the first request after a period of inactivity, so a timeout
// or a refused connection is retried with exponential backoff. An HTTP answer other than 200 is
// final. Never throws for network failures, they are reported through CameraProbeResult.
class CameraProbe
{
public:
    explicit CameraProbe(std::shared_ptr<Transport> transport, CameraProbeParams params = CameraProbeParams());

    CameraProbeResult probe(const PrinterDescriptor &printer) const;
    CameraProbeResult probe(const PrinterDescriptor &printer, int max_attempts, Milliseconds base_delay) const;

    // Wait before the attempt following attempt_index (0 based): base_delay * 2^attempt_index.
    static Milliseconds backoff_delay(Milliseconds base_delay, int attempt_index);

    std::string stream_url(const std::string &ip_address) const;
    std::string snapshot_url(const std::string &ip_address) const;

    const CameraProbeParams& params() const { return m_params; }

private:
    std::shared_ptr<Transport>  m_transport;
    CameraProbeParams           m_params;
};

} // namespace ForgeLink

#endif /* forgelink_CameraProbe_hpp_ */
