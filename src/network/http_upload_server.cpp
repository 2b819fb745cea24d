#include "rup/network/http_upload_server.hpp"

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace rup::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds kPollInterval{20};

std::string escape_segment(const std::string& segment) {
    std::ostringstream oss;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::string server_message(const HttpResponse& response) {
    const auto text = response.body_as_string();
    const auto parsed = json::parse(text, nullptr, false);
    if (parsed.is_object()) {
        if (parsed.contains("message") && parsed["message"].is_string()) {
            return parsed["message"].get<std::string>();
        }
        if (parsed.contains("error") && parsed["error"].is_string()) {
            return parsed["error"].get<std::string>();
        }
    }
    return response.reason_phrase;
}

Error failure_from(const HttpResponse& response, const std::string& what) {
    auto error = classify_http_status(response.status_code, server_message(response));
    error.message = what + ": " + error.message;
    return error;
}

/**
 * Drives one asynchronous phase of an exchange to completion.
 * The io_context is polled in short slices so a deadline or a
 * cancellation can close the socket mid-operation.
 */
class ExchangeRunner {
public:
    ExchangeRunner(asio::io_context& io, tcp::socket& socket, tcp::resolver& resolver,
                   const CancellationToken* cancel)
        : io_(io), socket_(socket), resolver_(resolver), cancel_(cancel) {}

    Result<void> run(const bool& finished, SteadyClock::time_point deadline, const char* phase) {
        io_.restart();
        while (!finished) {
            if (cancel_ && cancel_->is_cancelled()) {
                abort();
                return Err<void>(ErrorCode::Cancelled, std::string(phase) + " aborted");
            }
            const auto now = SteadyClock::now();
            if (now >= deadline) {
                abort();
                return Err<void>(ErrorCode::Timeout, std::string(phase) + " timed out");
            }
            const auto slice = std::min<SteadyClock::duration>(kPollInterval, deadline - now);
            io_.run_for(slice);
        }
        return Ok();
    }

private:
    void abort() {
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.close(ignored);
        // Let the aborted handlers run while their captures are still alive
        io_.restart();
        io_.run();
    }

    asio::io_context& io_;
    tcp::socket& socket_;
    tcp::resolver& resolver_;
    const CancellationToken* cancel_;
};

} // namespace

Error classify_http_status(int status_code, const std::string& detail) {
    const auto message = "HTTP " + std::to_string(status_code) + (detail.empty() ? "" : " " + detail);
    if (status_code == 401 || status_code == 403) {
        return Error{ErrorCode::Authentication, message};
    }
    if (status_code == 404) {
        return Error{ErrorCode::NotFound, message};
    }
    if (status_code == 408 || status_code == 425 || status_code == 429 || status_code >= 500) {
        return Error{ErrorCode::Transient, message};
    }
    return Error{ErrorCode::Validation, message};
}

HttpUploadServer::HttpUploadServer(ServerConfig config) : config_(std::move(config)) {}

std::string HttpUploadServer::upload_path(const std::string& upload_id) const {
    std::string base = config_.base_path;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    std::string path = base + "/uploads";
    if (!upload_id.empty()) {
        path += "/" + escape_segment(upload_id);
    }
    return path;
}

Result<HttpResponse> HttpUploadServer::execute(HttpRequest request, std::chrono::milliseconds timeout,
                                               const CancellationToken* cancel) const {
    request.set_header("Host", config_.host + ":" + std::to_string(config_.port));
    request.set_header("Connection", "close");
    request.set_header("Accept", "application/json");
    if (!config_.auth_token.empty()) {
        request.set_header("Authorization", "Bearer " + config_.auth_token);
    }
    const auto payload = request.serialize();
    const auto method = HttpMethodUtils::to_string(request.method);

    asio::io_context io;
    tcp::socket socket(io);
    tcp::resolver resolver(io);
    ExchangeRunner runner(io, socket, resolver, cancel);

    boost::system::error_code ec;
    bool finished = false;

    // Resolve and connect share the connect timeout
    const auto connect_deadline = SteadyClock::now() + config_.connect_timeout;
    tcp::resolver::results_type endpoints;
    resolver.async_resolve(config_.host, std::to_string(config_.port),
                           [&](const boost::system::error_code& error, tcp::resolver::results_type results) {
                               ec = error;
                               endpoints = std::move(results);
                               finished = true;
                           });
    if (auto step = runner.run(finished, connect_deadline, "resolve"); step.is_error()) {
        return Err<HttpResponse>(step.error());
    }
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transient, "cannot resolve " + config_.host + ": " + ec.message());
    }

    finished = false;
    asio::async_connect(socket, endpoints, [&](const boost::system::error_code& error, const tcp::endpoint&) {
        ec = error;
        finished = true;
    });
    if (auto step = runner.run(finished, connect_deadline, "connect"); step.is_error()) {
        return Err<HttpResponse>(step.error());
    }
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transient, "cannot connect to " + config_.host + ":" +
                                                           std::to_string(config_.port) + ": " + ec.message());
    }

    const auto deadline = SteadyClock::now() + timeout;

    finished = false;
    asio::async_write(socket, asio::buffer(payload), [&](const boost::system::error_code& error, std::size_t) {
        ec = error;
        finished = true;
    });
    if (auto step = runner.run(finished, deadline, "send"); step.is_error()) {
        return Err<HttpResponse>(step.error());
    }
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transient, method + " " + request.target + " send failed: " + ec.message());
    }

    asio::streambuf buffer;
    std::size_t head_size = 0;
    finished = false;
    asio::async_read_until(socket, buffer, "\r\n\r\n", [&](const boost::system::error_code& error, std::size_t n) {
        ec = error;
        head_size = n;
        finished = true;
    });
    if (auto step = runner.run(finished, deadline, "receive"); step.is_error()) {
        return Err<HttpResponse>(step.error());
    }
    if (ec) {
        return Err<HttpResponse>(ErrorCode::Transient,
                                 method + " " + request.target + " receive failed: " + ec.message());
    }

    std::string head(asio::buffers_begin(buffer.data()),
                     asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(head_size));
    buffer.consume(head_size);

    auto parsed = parse_response_head(head);
    if (parsed.is_error()) {
        return Err<HttpResponse>(parsed.error());
    }
    HttpResponse response = std::move(parsed.value());

    const auto length_header = response.get_header("Content-Length");
    if (!length_header.empty()) {
        std::size_t content_length = 0;
        try {
            content_length = static_cast<std::size_t>(std::stoull(length_header));
        } catch (const std::exception&) {
            return Err<HttpResponse>(ErrorCode::Transient, "invalid Content-Length: " + length_header);
        }
        if (buffer.size() < content_length) {
            finished = false;
            asio::async_read(socket, buffer, asio::transfer_exactly(content_length - buffer.size()),
                             [&](const boost::system::error_code& error, std::size_t) {
                                 ec = error;
                                 finished = true;
                             });
            if (auto step = runner.run(finished, deadline, "receive body"); step.is_error()) {
                return Err<HttpResponse>(step.error());
            }
            if (ec) {
                return Err<HttpResponse>(ErrorCode::Transient, "body receive failed: " + ec.message());
            }
        }
        response.body.assign(asio::buffers_begin(buffer.data()),
                             asio::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(content_length));
    } else {
        // No length: the server closes the connection after the body
        finished = false;
        asio::async_read(socket, buffer, asio::transfer_all(), [&](const boost::system::error_code& error, std::size_t) {
            ec = error;
            finished = true;
        });
        if (auto step = runner.run(finished, deadline, "receive body"); step.is_error()) {
            return Err<HttpResponse>(step.error());
        }
        if (ec && ec != asio::error::eof) {
            return Err<HttpResponse>(ErrorCode::Transient, "body receive failed: " + ec.message());
        }
        response.body.assign(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
    }

    boost::system::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    spdlog::debug("{} {} -> {}", method, request.target, response.status_code);
    return Ok(std::move(response));
}

Result<CreateUploadResponse> HttpUploadServer::create_upload(const CreateUploadRequest& request) {
    json body;
    body["fileName"] = request.file_name;
    body["relativePath"] = request.relative_path;
    body["basePath"] = request.base_path;
    body["totalSize"] = request.total_size;
    body["chunkSize"] = request.chunk_size;
    if (!request.client_upload_id.empty()) {
        body["uploadId"] = request.client_upload_id;
    }

    HttpRequest http;
    http.method = HttpMethod::POST;
    http.target = upload_path({});
    http.set_body(body.dump(), "application/json");

    auto response = execute(std::move(http), config_.request_timeout, nullptr);
    if (response.is_error()) {
        return Err<CreateUploadResponse>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<CreateUploadResponse>(failure_from(reply, "create upload for " + request.file_name));
    }

    const auto parsed = json::parse(reply.body_as_string(), nullptr, false);
    if (!parsed.is_object() || !parsed.contains("uploadId") || !parsed["uploadId"].is_string()) {
        return Err<CreateUploadResponse>(ErrorCode::Validation, "create upload reply has no uploadId");
    }

    CreateUploadResponse result;
    result.upload_id = parsed["uploadId"].get<std::string>();
    result.chunk_size = parsed.value("chunkSize", 0u);
    result.total_chunks = parsed.value("totalChunks", 0u);
    if (result.upload_id.empty()) {
        return Err<CreateUploadResponse>(ErrorCode::Validation, "create upload reply has an empty uploadId");
    }
    return Ok(std::move(result));
}

Result<ChunkReply> HttpUploadServer::put_chunk(const std::string& upload_id, std::uint32_t index,
                                               const std::vector<std::uint8_t>& bytes,
                                               std::chrono::milliseconds timeout, const CancellationToken& cancel) {
    HttpRequest http;
    http.method = HttpMethod::PUT;
    http.target = upload_path(upload_id) + "/chunks/" + std::to_string(index);
    http.set_body(bytes, "application/octet-stream");

    auto response = execute(std::move(http), timeout, &cancel);
    if (response.is_error()) {
        return Err<ChunkReply>(response.error());
    }
    const auto& reply = response.value();

    ChunkReply result;
    result.acked_index = index;
    if (reply.status_code == static_cast<int>(HttpStatus::CONFLICT)) {
        result.outcome = ChunkOutcome::AlreadyAcked;
        return Ok(result);
    }
    if (!reply.is_success()) {
        return Err<ChunkReply>(failure_from(reply, "chunk " + std::to_string(index) + " of " + upload_id));
    }

    const auto parsed = json::parse(reply.body_as_string(), nullptr, false);
    if (parsed.is_object() && parsed.contains("ackedIndex") && parsed["ackedIndex"].is_number_unsigned()) {
        result.acked_index = parsed["ackedIndex"].get<std::uint32_t>();
    }
    return Ok(result);
}

Result<RemoteUploadStatus> HttpUploadServer::get_status(const std::string& upload_id) {
    HttpRequest http;
    http.method = HttpMethod::GET;
    http.target = upload_path(upload_id);

    auto response = execute(std::move(http), config_.request_timeout, nullptr);
    if (response.is_error()) {
        return Err<RemoteUploadStatus>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.is_success()) {
        return Err<RemoteUploadStatus>(failure_from(reply, "status of " + upload_id));
    }

    RemoteUploadStatus status;
    try {
        const auto parsed = json::parse(reply.body_as_string());
        status.upload_id = parsed.value("uploadId", upload_id);
        status.status = parsed.value("status", std::string());
        status.total_chunks = parsed.value("totalChunks", 0u);
        if (parsed.contains("uploadedChunks")) {
            status.acked_chunks = parsed.at("uploadedChunks").get<std::vector<std::uint32_t>>();
        }
    } catch (const json::exception& e) {
        return Err<RemoteUploadStatus>(ErrorCode::Validation, std::string("malformed status reply: ") + e.what());
    }
    return Ok(std::move(status));
}

Result<void> HttpUploadServer::discard(const std::string& upload_id) {
    HttpRequest http;
    http.method = HttpMethod::DELETE_METHOD;
    http.target = upload_path(upload_id);

    auto response = execute(std::move(http), config_.request_timeout, nullptr);
    if (response.is_error()) {
        return Err<void>(response.error());
    }
    const auto& reply = response.value();
    if (!reply.is_success() && reply.status_code != static_cast<int>(HttpStatus::NOT_FOUND)) {
        return Err<void>(failure_from(reply, "discard " + upload_id));
    }
    return Ok();
}

} // namespace rup::network
