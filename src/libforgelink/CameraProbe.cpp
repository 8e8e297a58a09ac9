#include "CameraProbe.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <regex>
#include <thread>

#include <boost/format.hpp>
#include <boost/log/trivial.hpp>

namespace ForgeLink {

namespace {

enum class AttemptOutcome {
    Available,
    // The streamer answered with an error status.
    Refused,
    // Connection refused, reset or timed out.
    Unreachable
};

// Bytes of the response read while looking for the status line.
static constexpr size_t STATUS_LINE_MAX = 1024;

} // namespace

CameraProbe::CameraProbe(std::shared_ptr<Transport> transport, CameraProbeParams params)
    : m_transport(std::move(transport))
    , m_params(std::move(params))
{}

std::string CameraProbe::stream_url(const std::string &ip_address) const
{
    return (boost::format("http://%1%:%2%%3%") % ip_address % m_params.port % m_params.stream_path).str();
}

std::string CameraProbe::snapshot_url(const std::string &ip_address) const
{
    return (boost::format("http://%1%:%2%%3%") % ip_address % m_params.port % m_params.snapshot_path).str();
}

Milliseconds CameraProbe::backoff_delay(Milliseconds base_delay, int attempt_index)
{
    // Keep the shift within range, the total wait is capped anyway.
    return base_delay * (1LL << std::clamp(attempt_index, 0, 20));
}

CameraProbeResult CameraProbe::probe(const PrinterDescriptor &printer) const
{
    return this->probe(printer, m_params.max_attempts, m_params.base_delay);
}

CameraProbeResult CameraProbe::probe(const PrinterDescriptor &printer, int max_attempts, Milliseconds base_delay) const
{
    static const std::regex re_status_line(R"(^HTTP/1\.[01]\s+(\d{3}))", std::regex::icase);

    CameraProbeResult result;
    result.stream_url   = this->stream_url(printer.ip_address);
    result.snapshot_url = this->snapshot_url(printer.ip_address);

    const std::string request = (boost::format("GET %1% HTTP/1.1\r\nHost: %2%:%3%\r\nConnection: close\r\n\r\n")
        % m_params.stream_path % printer.ip_address % m_params.port).str();

    max_attempts = std::max(max_attempts, 1);
    Milliseconds waited { 0 };
    for (int attempt = 0; attempt < max_attempts; ++ attempt) {
        result.attempts = attempt + 1;
        const Clock::time_point started = Clock::now();
        AttemptOutcome outcome = AttemptOutcome::Unreachable;
        try {
            std::unique_ptr<StreamChannel> channel = m_transport->connect(printer.ip_address, m_params.port, m_params.attempt_timeout);
            const Deadline deadline = started + m_params.attempt_timeout;
            channel->write(request, deadline);
            std::string response;
            while (response.find('\n') == std::string::npos && response.size() < STATUS_LINE_MAX)
                response += channel->read_some(deadline);
            channel->close();

            std::smatch match;
            if (std::regex_search(response, match, re_status_line) && match[1].str() == "200") {
                outcome = AttemptOutcome::Available;
                result.last_latency_ms = std::chrono::duration_cast<Milliseconds>(Clock::now() - started).count();
            } else {
                outcome = AttemptOutcome::Refused;
                result.error = "Camera stream answered: " + response.substr(0, response.find_first_of("\r\n"));
            }
        } catch (const IOError &ex) {
            result.error = ex.what();
        }

        if (outcome == AttemptOutcome::Available) {
            result.available = true;
            result.error.clear();
            BOOST_LOG_TRIVIAL(info) << "Camera of " << printer.display_name() << " available after " << result.attempts
                << " attempt(s), " << *result.last_latency_ms << " ms";
            return result;
        }
        if (outcome == AttemptOutcome::Refused) {
            BOOST_LOG_TRIVIAL(warning) << "Camera of " << printer.display_name() << " unavailable: " << result.error;
            return result;
        }

        BOOST_LOG_TRIVIAL(debug) << "Camera attempt " << result.attempts << " of " << max_attempts << " on " << printer.display_name() << " failed: " << result.error;
        if (attempt + 1 == max_attempts)
            break;
        const Milliseconds delay = std::min(backoff_delay(base_delay, attempt), m_params.max_total_wait - waited);
        if (delay <= Milliseconds::zero()) {
            BOOST_LOG_TRIVIAL(debug) << "Camera wait budget of " << m_params.max_total_wait.count() << " ms spent";
            break;
        }
        std::this_thread::sleep_for(delay);
        waited += delay;
    }

    BOOST_LOG_TRIVIAL(warning) << "Camera of " << printer.display_name() << " unavailable after " << result.attempts << " attempt(s): " << result.error;
    return result;
}

} // namespace ForgeLink
