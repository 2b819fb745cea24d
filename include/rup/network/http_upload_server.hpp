#pragma once

#include "rup/core/config.hpp"
#include "rup/network/http_types.hpp"
#include "rup/network/upload_server.hpp"

#include <chrono>
#include <string>

namespace rup::network {

/**
 * @brief UploadServer over plain HTTP/1.1 using Boost.Asio
 *
 * One connection per request ("Connection: close"), so the object can be
 * shared by every transfer worker without locking. Each exchange runs on
 * a private io_context that is polled in short slices; between slices the
 * deadline and the cancellation token are checked, and the socket is
 * closed to abort the pending operation.
 */
class HttpUploadServer : public UploadServer {
public:
    explicit HttpUploadServer(ServerConfig config);

    Result<CreateUploadResponse> create_upload(const CreateUploadRequest& request) override;

    Result<ChunkReply> put_chunk(const std::string& upload_id, std::uint32_t index,
                                 const std::vector<std::uint8_t>& bytes, std::chrono::milliseconds timeout,
                                 const CancellationToken& cancel) override;

    Result<RemoteUploadStatus> get_status(const std::string& upload_id) override;

    Result<void> discard(const std::string& upload_id) override;

    const ServerConfig& config() const noexcept { return config_; }

private:
    Result<HttpResponse> execute(HttpRequest request, std::chrono::milliseconds timeout,
                                 const CancellationToken* cancel) const;

    std::string upload_path(const std::string& upload_id) const;

    ServerConfig config_;
};

} // namespace rup::network
