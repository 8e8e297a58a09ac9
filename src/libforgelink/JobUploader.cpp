#include "JobUploader.hpp"
#include "Exception.hpp"
#include "ReplyParser.hpp"
#include "Utils.hpp"

#include <algorithm>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/crc.hpp>
#include <boost/filesystem.hpp>
#include <boost/log/trivial.hpp>

namespace ForgeLink {

static const char *ALLOWED_EXTENSIONS[] = { ".gcode", ".gx", ".g" };

static void append_u32_le(std::string &out, uint32_t value)
{
    for (int i = 0; i < 4; ++ i)
        out.push_back(char((value >> (8 * i)) & 0xFF));
}

const char* to_string(UploadJob::State state)
{
    switch (state) {
    case UploadJob::State::Pending:         return "pending";
    case UploadJob::State::Transferring:    return "transferring";
    case UploadJob::State::Completed:       return "completed";
    case UploadJob::State::Started:         return "started";
    case UploadJob::State::Failed:          return "failed";
    }
    return "unknown";
}

UploadJob UploadJob::from_file(const std::string &local_path, bool start_after_upload, const std::string &remote_file_name)
{
    namespace fs = boost::filesystem;
    const fs::path path(local_path);
    boost::system::error_code ec;
    if (! fs::is_regular_file(path, ec))
        throw FileIOError("File not found: " + local_path);
    const std::string extension = boost::algorithm::to_lower_copy(path.extension().string());
    if (std::find(std::begin(ALLOWED_EXTENSIONS), std::end(ALLOWED_EXTENSIONS), extension) == std::end(ALLOWED_EXTENSIONS))
        throw UploadError("Not a machine instruction file (.gcode, .gx, .g): " + local_path);
    const boost::uintmax_t size = fs::file_size(path, ec);
    if (ec)
        throw FileIOError("Cannot read the size of " + local_path + ": " + ec.message());
    if (size == 0)
        throw UploadError("Refusing to upload the empty file " + local_path);

    UploadJob job;
    job.local_path         = local_path;
    job.remote_file_name   = remote_file_name.empty() ? path.filename().string() : remote_file_name;
    job.start_after_upload = start_after_upload;
    job.bytes_total        = size_t(size);
    return job;
}

UploadTransfer::UploadTransfer(ControlSession &session, UploadJob job, size_t chunk_size)
    : m_lease(std::make_unique<ControlSession::TransferLease>(session))
    , m_job(std::move(job))
    , m_chunk_size(chunk_size)
{}

UploadTransfer::~UploadTransfer()
{
    if (m_lease && m_job.state == UploadJob::State::Transferring) {
        BOOST_LOG_TRIVIAL(warning) << "Upload of " << m_job.remote_file_name << " abandoned after " << m_job.bytes_sent << " bytes";
        m_lease->abort("Upload of " + m_job.remote_file_name + " was abandoned");
    }
}

std::optional<UploadProgress> UploadTransfer::next()
{
    if (m_job.is_terminal() || ! m_lease)
        return std::nullopt;

    try {
        if (m_job.state == UploadJob::State::Pending)
            this->open_transfer();

        const size_t      length = std::min(m_chunk_size, m_job.bytes_total - m_job.bytes_sent);
        std::vector<char> buffer(length);
        if (! m_file->read(buffer.data(), std::streamsize(length)))
            throw FileIOError("Reading " + m_job.local_path + " failed after " + std::to_string(m_job.bytes_sent) + " bytes");

        m_lease->write(JobUploader::encode_chunk(m_chunk_index, buffer.data(), length));

        UploadProgress progress;
        progress.chunk_index = m_chunk_index ++;
        m_job.bytes_sent    += length;
        progress.bytes_sent  = m_job.bytes_sent;
        progress.bytes_total = m_job.bytes_total;
        BOOST_LOG_TRIVIAL(trace) << "Sent chunk " << progress.chunk_index << " of " << m_job.remote_file_name << ", " << progress.bytes_sent << "/" << progress.bytes_total;

        if (m_job.bytes_sent == m_job.bytes_total)
            this->finish_transfer();
        return progress;
    } catch (const RemoteRejectedError &ex) {
        BOOST_LOG_TRIVIAL(error) << "Printer rejected the upload of " << m_job.remote_file_name << ": " << ex.what();
        if (m_job.state == UploadJob::State::Transferring)
            m_lease->abort(ex.what());
        // A refused start leaves the stored file in place.
        if (m_job.state != UploadJob::State::Completed)
            m_job.state = UploadJob::State::Failed;
        this->release();
        throw;
    } catch (const IOError &ex) {
        BOOST_LOG_TRIVIAL(error) << "Upload of " << m_job.remote_file_name << " failed: " << ex.what();
        if (m_job.state == UploadJob::State::Transferring)
            m_lease->abort(ex.what());
        m_job.state = UploadJob::State::Failed;
        this->release();
        throw UploadError("Upload of " + m_job.remote_file_name + " failed: " + ex.what());
    } catch (const Exception &ex) {
        BOOST_LOG_TRIVIAL(error) << "Upload of " << m_job.remote_file_name << " failed: " << ex.what();
        if (m_job.state == UploadJob::State::Transferring)
            m_lease->abort(ex.what());
        m_job.state = UploadJob::State::Failed;
        this->release();
        throw;
    }
}

const UploadJob& UploadTransfer::run(const OnProgressFn &on_progress)
{
    while (std::optional<UploadProgress> progress = this->next())
        if (on_progress)
            on_progress(*progress);
    return m_job;
}

void UploadTransfer::open_transfer()
{
    m_file = std::make_unique<boost::nowide::ifstream>(m_job.local_path, std::ios::in | std::ios::binary);
    if (! m_file->good())
        throw FileIOError("Cannot open " + m_job.local_path);

    BOOST_LOG_TRIVIAL(info) << "Uploading " << m_job.local_path << " (" << format_memsize(m_job.bytes_total) << ") to "
        << m_lease->session().descriptor().display_name() << " as " << m_job.remote_path();
    // An error reply surfaces as RemoteRejectedError before any data was sent.
    m_lease->command("M28 " + std::to_string(m_job.bytes_total) + " " + m_job.remote_path());
    m_job.state = UploadJob::State::Transferring;
}

void UploadTransfer::finish_transfer()
{
    m_file.reset();
    const std::string reply = m_lease->command("M29");
    if (ReplyParser::reply_reports_failure(reply))
        throw RemoteRejectedError("Printer did not store " + m_job.remote_file_name + ": " + boost::algorithm::trim_copy(reply));
    m_job.state = UploadJob::State::Completed;
    BOOST_LOG_TRIVIAL(info) << "Upload of " << m_job.remote_file_name << " completed";

    if (m_job.start_after_upload) {
        const std::string start_reply = m_lease->command("M23 " + m_job.remote_path());
        if (ReplyParser::reply_reports_failure(start_reply))
            throw RemoteRejectedError("Printer refused to start " + m_job.remote_file_name + ": " + boost::algorithm::trim_copy(start_reply));
        m_job.state = UploadJob::State::Started;
        BOOST_LOG_TRIVIAL(info) << "Started printing " << m_job.remote_file_name;
    }
    this->release();
}

void UploadTransfer::release()
{
    m_file.reset();
    m_lease.reset();
}

JobUploader::JobUploader(size_t chunk_size) : m_chunk_size(chunk_size)
{
    if (m_chunk_size == 0)
        throw LogicError("Upload chunk size must not be zero");
}

UploadTransfer JobUploader::upload(ControlSession &session, UploadJob job) const
{
    if (job.state != UploadJob::State::Pending)
        throw LogicError(std::string("Upload job is ") + to_string(job.state) + ", it cannot be sent again");
    if (job.bytes_total == 0)
        throw UploadError("Refusing to upload the empty file " + job.local_path);
    job.bytes_sent = 0;
    return UploadTransfer(session, std::move(job), m_chunk_size);
}

std::string JobUploader::encode_chunk(uint32_t index, const char *data, size_t size)
{
    boost::crc_32_type crc;
    crc.process_bytes(data, size);

    std::string packet;
    packet.reserve(16 + size);
    packet += "\x5A\x5A\xA5\xA5";
    append_u32_le(packet, index);
    append_u32_le(packet, uint32_t(size));
    packet.append(data, size);
    append_u32_le(packet, crc.checksum());
    return packet;
}

} // namespace ForgeLink
