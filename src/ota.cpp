// ============================================================================
// ota.cpp - implementation for ota.hpp
// ============================================================================

#include "rtlslink/ota.hpp"
#include "rtlslink/device_connection.hpp"   // split_host_port(), resolve_until()

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace rtlslink {

namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = net::ip::tcp;

// ---------------------------------------------------------------------------
// Image loading and body assembly
// ---------------------------------------------------------------------------

Result<FirmwareImage> load_firmware(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return validation_error("Firmware file not found: " + path);

    std::ifstream in(path, std::ios::binary);
    if (!in) return validation_error("Cannot read firmware file: " + path);

    auto bytes = std::make_shared<std::vector<uint8_t>>(
        std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) return validation_error("Cannot read firmware file: " + path);

    FirmwareImage img;
    img.data     = std::move(bytes);
    img.filename = fs::path(path).filename().string();
    return img;
}

static std::string make_boundary() {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> pick(0, 15);
    std::string b = "----rtlslink";
    for (int i = 0; i < 24; ++i) b.push_back(hex[pick(gen)]);
    return b;
}

std::string multipart_preamble(const std::string& boundary, const std::string& filename) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: form-data; name=\"firmware\"; filename=\"" + filename + "\"\r\n"
           "Content-Type: application/octet-stream\r\n\r\n";
}

std::string multipart_trailer(const std::string& boundary) {
    return "\r\n--" + boundary + "--\r\n";
}

std::string build_multipart_body(const std::string& boundary,
                                 const std::vector<uint8_t>& data,
                                 const std::string& filename) {
    std::string body = multipart_preamble(boundary, filename);
    body.append(reinterpret_cast<const char*>(data.data()), data.size());
    body += multipart_trailer(boundary);
    return body;
}


// ---------------------------------------------------------------------------
// HttpUploadClient::upload()
// --------------------------
// resolve -> connect -> header -> {preamble, image, trailer} -> response,
// all under one deadline. The image goes out straight from the shared
// buffer; only the header and the two small multipart pieces are built here.
// ---------------------------------------------------------------------------
Status HttpUploadClient::upload(AsyncContext& ctx, const std::string& ip, const FirmwareImage& image) {
    if (!image.data) return validation_error("Firmware image is empty");

    const HostPort hp = split_host_port(ip);
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    beast::error_code ec;

    auto endpoints = resolve_until(ctx, hp, deadline, ip, "HTTP resolve of " + ip + " timed out");
    if (!endpoints) return endpoints.error();

    beast::tcp_stream stream(ctx.io);
    stream.expires_at(deadline);

    auto fail = [&](const char* stage) -> Error {
        if (ec == beast::error::timeout)
            return timeout_error(ip, std::string("HTTP ") + stage + " to " + ip + " timed out");
        return transport_error(ip, "HTTP request to " + ip + " failed: " + ec.message());
    };

    stream.async_connect(endpoints.value(), ctx.yield[ec]);
    if (ec) return fail("connect");

    const std::string boundary = make_boundary();
    const std::string preamble = multipart_preamble(boundary, image.filename);
    const std::string trailer  = multipart_trailer(boundary);

    http::request<http::empty_body> req{http::verb::post, "/update", 11};
    req.set(http::field::host, hp.host + ":" + hp.port);
    req.set(http::field::user_agent, "rtlslink");
    req.set(http::field::content_type, "multipart/form-data; boundary=" + boundary);
    req.content_length(preamble.size() + image.data->size() + trailer.size());

    http::request_serializer<http::empty_body> sr{req};
    http::async_write_header(stream, sr, ctx.yield[ec]);
    if (ec) return fail("upload");

    const std::array<net::const_buffer, 3> body{
        net::buffer(preamble),
        net::buffer(image.data->data(), image.data->size()),
        net::buffer(trailer),
    };
    net::async_write(stream, body, ctx.yield[ec]);
    if (ec) return fail("upload");

    beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::async_read(stream, buf, res, ctx.yield[ec]);
    if (ec) return fail("response");

    beast::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

    const unsigned code = res.result_int();
    if (code < 200 || code > 299)
        return ota_failed(ip, "HTTP " + std::to_string(code) + ": " + res.body());
    return {};
}

Result<std::shared_ptr<IUploadClient>> make_http_upload_client() {
    return std::shared_ptr<IUploadClient>(std::make_shared<HttpUploadClient>());
}


// ---------------------------------------------------------------------------
// Single and bulk entry points
// ---------------------------------------------------------------------------

Status upload_image(AsyncContext& ctx, IUploadClient& client, const std::string& ip,
                    const FirmwareImage& image, ProgressHandler& progress) {
    const uint64_t total = image.size();
    spdlog::info("ota: {} <- {} ({} bytes)", ip, image.filename, total);

    progress.on_progress(ip, 0, total);
    Status st = client.upload(ctx, ip, image);
    if (!st) {
        spdlog::warn("ota: {} failed: {}", ip, st.error().message);
        progress.on_error(ip, st.error().to_string());
        return st;
    }
    progress.on_progress(ip, total, total);
    progress.on_complete(ip);
    spdlog::info("ota: {} done", ip);
    return st;
}

Status upload_firmware(const std::string& ip, const std::string& path,
                       ProgressHandler& progress, const UploadClientFactory& factory) {
    auto image = load_firmware(path);
    if (!image) return image.error();

    auto client = factory();
    if (!client) return client.error();

    const FirmwareImage& img = image.value();
    IUploadClient& c = *client.value();
    return run_blocking([&](AsyncContext& ctx) {
        return upload_image(ctx, c, ip, img, progress);
    });
}

BatchResult<void> upload_firmware_bulk(const std::vector<std::string>& ips,
                                       std::shared_ptr<const std::vector<uint8_t>> data,
                                       const std::string& filename,
                                       std::size_t concurrency,
                                       ProgressHandler& progress,
                                       const UploadClientFactory& factory,
                                       const CancelToken& cancel) {
    auto client = factory();
    if (!client) {
        BatchResult<void> out;
        for (const auto& ip : ips) {
            out.items.push_back(BatchItem<void>{ip, Status(client.error())});
            progress.on_error(ip, client.error().to_string());
        }
        return out;
    }

    FirmwareImage image{std::move(data), filename};
    std::shared_ptr<IUploadClient> shared = client.value();

    return dispatch(ips, concurrency,
        [&](AsyncContext& ctx, const std::string& ip) {
            return upload_image(ctx, *shared, ip, image, progress);
        },
        cancel);
}

} // namespace rtlslink
