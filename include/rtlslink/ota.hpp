#pragma once
/**
 * @page rl-ota RTLS-Link OTA Uploader
 * @file ota.hpp
 * @brief Push a firmware image to one or many devices over HTTP.
 *
 * @details
 * PURPOSE
 * -------
 * Devices accept firmware as a multipart/form-data POST to
 * `http://ip/update`. The body has exactly one part:
 *
 *   Content-Disposition: form-data; name="firmware"; filename="<base name>"
 *   Content-Type: application/octet-stream
 *
 * A 2xx status is success. Anything else is OtaFailed with message
 * "HTTP <code>: <body>". The device reboots into the new image afterwards.
 *
 * TRANSPORT SEAM
 * --------------
 * The HTTP exchange sits behind IUploadClient so bulk logic can be tested
 * without a network. HttpUploadClient is the Boost.Beast implementation with
 * a fixed 120 s deadline per upload. Clients come from an UploadClientFactory;
 * if the factory fails, a bulk upload reports that error for every IP and
 * sends nothing.
 *
 * PROGRESS
 * --------
 * ProgressHandler receives on_progress(ip, 0, total) when an upload starts,
 * on_progress(ip, total, total) and on_complete(ip) when it succeeds, and
 * on_error(ip, message) when it fails. All callbacks run on the dispatcher's
 * single thread.
 *
 * @code
 *   rtlslink::NoopProgress quiet;
 *   auto st = rtlslink::upload_firmware("10.0.0.7", "build/firmware.bin", quiet);
 *   if (!st) std::cerr << st.error().to_string() << "\n";
 * @endcode
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rtlslink/batch.hpp"
#include "rtlslink/cancel.hpp"
#include "rtlslink/error.hpp"
#include "rtlslink/runtime.hpp"

namespace rtlslink {

constexpr std::chrono::seconds kOtaTimeout{120};

class ProgressHandler {
public:
    virtual ~ProgressHandler() = default;
    virtual void on_progress(const std::string& ip, uint64_t sent, uint64_t total) = 0;
    virtual void on_complete(const std::string& ip) = 0;
    virtual void on_error(const std::string& ip, const std::string& message) = 0;
};

class NoopProgress : public ProgressHandler {
public:
    void on_progress(const std::string&, uint64_t, uint64_t) override {}
    void on_complete(const std::string&) override {}
    void on_error(const std::string&, const std::string&) override {}
};

/// Image bytes loaded once and shared by every upload in a bulk run.
struct FirmwareImage {
    std::shared_ptr<const std::vector<uint8_t>> data;
    std::string                                 filename;   ///< base name only

    uint64_t size() const { return data ? data->size() : 0; }
};

/// Read a firmware file. Missing or unreadable file is a Validation error.
Result<FirmwareImage> load_firmware(const std::string& path);

/// Everything of the "firmware" part that precedes the image bytes.
std::string multipart_preamble(const std::string& boundary, const std::string& filename);

/// CRLF plus the closing boundary.
std::string multipart_trailer(const std::string& boundary);

/// preamble + data + trailer in one string. The upload client never builds
/// this; it streams the three pieces so the image is not copied per device.
std::string build_multipart_body(const std::string& boundary,
                                 const std::vector<uint8_t>& data,
                                 const std::string& filename);

class IUploadClient {
public:
    virtual ~IUploadClient() = default;
    virtual Status upload(AsyncContext& ctx, const std::string& ip, const FirmwareImage& image) = 0;
};

/// Boost.Beast HTTP/1.1 client. One connection per upload.
class HttpUploadClient : public IUploadClient {
public:
    explicit HttpUploadClient(std::chrono::milliseconds timeout = kOtaTimeout) : timeout_(timeout) {}
    Status upload(AsyncContext& ctx, const std::string& ip, const FirmwareImage& image) override;

private:
    std::chrono::milliseconds timeout_;
};

using UploadClientFactory = std::function<Result<std::shared_ptr<IUploadClient>>()>;

/// Default factory: a HttpUploadClient with the 120 s deadline.
Result<std::shared_ptr<IUploadClient>> make_http_upload_client();

/// Upload one image to one device, reporting through progress.
Status upload_image(AsyncContext& ctx, IUploadClient& client, const std::string& ip,
                    const FirmwareImage& image, ProgressHandler& progress);

/**
 * @brief Single device: load the file, then upload it.
 *
 * The file is checked before any network activity.
 */
Status upload_firmware(const std::string& ip, const std::string& path,
                       ProgressHandler& progress,
                       const UploadClientFactory& factory = make_http_upload_client);

/**
 * @brief Many devices, at most `concurrency` uploads in flight.
 *
 * One client from factory is shared by all uploads. Results follow the same
 * rules as dispatch() (batch.hpp).
 */
BatchResult<void> upload_firmware_bulk(const std::vector<std::string>& ips,
                                       std::shared_ptr<const std::vector<uint8_t>> data,
                                       const std::string& filename,
                                       std::size_t concurrency,
                                       ProgressHandler& progress,
                                       const UploadClientFactory& factory = make_http_upload_client,
                                       const CancelToken& cancel = CancelToken());

} // namespace rtlslink
