#ifndef forgelink_JobUploader_hpp_
#define forgelink_JobUploader_hpp_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/nowide/fstream.hpp>

#include "ControlSession.hpp"

namespace ForgeLink {

// A machine instruction file to be stored on the printer, and optionally printed.
struct UploadJob
{
    enum class State {
        Pending,
        Transferring,
        // M29 acknowledged, the file is stored on the printer.
        Completed,
        // M23 acknowledged after Completed.
        Started,
        Failed
    };

    std::string local_path;
    std::string remote_file_name;
    bool        start_after_upload = false;
    size_t      bytes_total        = 0;
    size_t      bytes_sent         = 0;
    State       state              = State::Pending;

    // Throws FileIOError if the file is missing or unreadable,
    // UploadError if it is empty or its extension is not one of .gcode, .gx, .g
    // Remote file name defaults to the local file name.
    static UploadJob from_file(const std::string &local_path, bool start_after_upload = false, const std::string &remote_file_name = std::string());

    // "0:/user/<remote_file_name>"
    std::string remote_path() const { return REMOTE_USER_DIR + remote_file_name; }
    bool        is_terminal() const { return state == State::Completed || state == State::Started || state == State::Failed; }
};

const char* to_string(UploadJob::State state);

struct UploadProgress
{
    size_t bytes_sent  = 0;
    size_t bytes_total = 0;
    size_t chunk_index = 0;

    double percent() const { return bytes_total == 0 ? 100. : 100. * double(bytes_sent) / double(bytes_total); }
};

// Lazy sequence of upload steps. The first next() opens the transfer (M28), every call then
// sends one data packet; after the last packet the close handshake (M29) and the optional start
// (M23) are performed. next() returns nullopt once the job is terminal. Not restartable.
//
// The transfer holds the session's TransferLease for its whole lifetime.
class UploadTransfer
{
public:
    UploadTransfer(ControlSession &session, UploadJob job, size_t chunk_size);
    UploadTransfer(UploadTransfer &&) = default;
    UploadTransfer(const UploadTransfer &) = delete;
    UploadTransfer& operator=(const UploadTransfer &) = delete;
    ~UploadTransfer();

    // Throws RemoteRejectedError if the printer refuses a step, UploadError on transport failure.
    // Either way the job ends in State::Failed.
    std::optional<UploadProgress> next();

    using OnProgressFn = std::function<void(const UploadProgress &progress)>;
    // Drain the sequence, reporting every packet sent.
    const UploadJob& run(const OnProgressFn &on_progress = OnProgressFn());

    const UploadJob& job() const { return m_job; }

private:
    void open_transfer();
    void finish_transfer();
    void release();

    std::unique_ptr<ControlSession::TransferLease>  m_lease;
    UploadJob                                       m_job;
    size_t                                          m_chunk_size;
    std::unique_ptr<boost::nowide::ifstream>        m_file;
    uint32_t                                        m_chunk_index = 0;
};

class JobUploader
{
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 4096;

    explicit JobUploader(size_t chunk_size = DEFAULT_CHUNK_SIZE);

    // Takes the session's transfer lease: throws SessionBusyError if the session is in use,
    // ConnectionError if it is not connected. Nothing is sent before the first next().
    UploadTransfer upload(ControlSession &session, UploadJob job) const;

    // 5A 5A A5 A5 | index u32 | length u32 | data | crc32(data) u32, integers little endian.
    static std::string encode_chunk(uint32_t index, const char *data, size_t size);
    static std::string encode_chunk(uint32_t index, const std::string &data) { return encode_chunk(index, data.data(), data.size()); }

private:
    size_t m_chunk_size;
};

} // namespace ForgeLink

#endif /* forgelink_JobUploader_hpp_ */
