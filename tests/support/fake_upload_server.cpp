#include "support/fake_upload_server.hpp"

namespace rup::testing {

Result<network::CreateUploadResponse> FakeUploadServer::create_upload(const network::CreateUploadRequest& request) {
    std::lock_guard lock(mutex_);
    created_.push_back(request);
    if (create_failure_) {
        auto error = *create_failure_;
        create_failure_.reset();
        return Err<network::CreateUploadResponse>(error);
    }

    network::CreateUploadResponse response;
    response.upload_id = assign_ids_ || request.client_upload_id.empty()
        ? "srv-" + std::to_string(next_server_id_++)
        : request.client_upload_id;
    response.chunk_size = request.chunk_size;
    response.total_chunks = request.chunk_size == 0
        ? 0
        : static_cast<std::uint32_t>((request.total_size + request.chunk_size - 1) / request.chunk_size);
    uploads_[response.upload_id].total_chunks = response.total_chunks;
    return Ok(response);
}

Result<network::ChunkReply> FakeUploadServer::put_chunk(const std::string& upload_id, std::uint32_t index,
                                                        const std::vector<std::uint8_t>&,
                                                        std::chrono::milliseconds,
                                                        const CancellationToken& cancel) {
    const auto now_in_flight = ++in_flight_;
    auto peak = peak_in_flight_.load();
    while (now_in_flight > peak && !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
    }

    struct Leave {
        std::atomic<std::size_t>& counter;
        ~Leave() { --counter; }
    } leave{in_flight_};

    std::chrono::milliseconds latency{0};
    {
        std::unique_lock lock(mutex_);
        ++put_calls_;
        sent_[upload_id].push_back(index);
        latency = latency_;

        if (hold_) {
            ++blocked_;
            cv_.notify_all();
            while (hold_ && !cancel.is_cancelled()) {
                cv_.wait_for(lock, std::chrono::milliseconds(5));
            }
            --blocked_;
        }
    }

    if (latency.count() > 0 && cancel.wait_for(latency)) {
        return Err<network::ChunkReply>(ErrorCode::Cancelled, "request aborted");
    }
    if (cancel.is_cancelled()) {
        return Err<network::ChunkReply>(ErrorCode::Cancelled, "request aborted");
    }

    std::lock_guard lock(mutex_);
    if (auto failure = take_failure_locked(upload_id, index)) {
        return Err<network::ChunkReply>(*failure);
    }

    auto& upload = uploads_[upload_id];
    network::ChunkReply reply;
    reply.acked_index = index;
    reply.outcome = upload.acked.insert(index).second ? network::ChunkOutcome::Acked
                                                      : network::ChunkOutcome::AlreadyAcked;
    return Ok(reply);
}

Result<network::RemoteUploadStatus> FakeUploadServer::get_status(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    if (status_failure_) {
        return Err<network::RemoteUploadStatus>(*status_failure_);
    }
    auto it = uploads_.find(upload_id);
    if (it == uploads_.end()) {
        return Err<network::RemoteUploadStatus>(ErrorCode::NotFound, "HTTP 404 unknown upload " + upload_id);
    }
    network::RemoteUploadStatus status;
    status.upload_id = upload_id;
    status.total_chunks = it->second.total_chunks;
    status.acked_chunks.assign(it->second.acked.begin(), it->second.acked.end());
    status.status = status.total_chunks > 0 && it->second.acked.size() == status.total_chunks ? "completed"
                                                                                              : "uploading";
    return Ok(status);
}

Result<void> FakeUploadServer::discard(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    discarded_.push_back(upload_id);
    uploads_.erase(upload_id);
    cv_.notify_all();
    return Ok();
}

void FakeUploadServer::assign_server_ids(bool enabled) {
    std::lock_guard lock(mutex_);
    assign_ids_ = enabled;
}

void FakeUploadServer::fail_chunk(const std::string& upload_id, std::uint32_t index, std::size_t times, Error error) {
    std::lock_guard lock(mutex_);
    auto& queue = failures_[{upload_id, index}];
    for (std::size_t i = 0; i < times; ++i) {
        queue.push_back(error);
    }
}

void FakeUploadServer::fail_next_create(Error error) {
    std::lock_guard lock(mutex_);
    create_failure_ = std::move(error);
}

void FakeUploadServer::fail_status(std::optional<Error> error) {
    std::lock_guard lock(mutex_);
    status_failure_ = std::move(error);
}

void FakeUploadServer::set_latency(std::chrono::milliseconds latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

void FakeUploadServer::hold_chunks() {
    std::lock_guard lock(mutex_);
    hold_ = true;
}

void FakeUploadServer::release_chunks() {
    {
        std::lock_guard lock(mutex_);
        hold_ = false;
    }
    cv_.notify_all();
}

void FakeUploadServer::preload(const std::string& upload_id, std::uint32_t total_chunks,
                               std::vector<std::uint32_t> acked) {
    std::lock_guard lock(mutex_);
    auto& upload = uploads_[upload_id];
    upload.total_chunks = total_chunks;
    upload.acked.insert(acked.begin(), acked.end());
}

void FakeUploadServer::forget(const std::string& upload_id) {
    std::lock_guard lock(mutex_);
    uploads_.erase(upload_id);
}

std::vector<std::uint32_t> FakeUploadServer::sent(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    auto it = sent_.find(upload_id);
    return it == sent_.end() ? std::vector<std::uint32_t>{} : it->second;
}

std::set<std::uint32_t> FakeUploadServer::acked(const std::string& upload_id) const {
    std::lock_guard lock(mutex_);
    auto it = uploads_.find(upload_id);
    return it == uploads_.end() ? std::set<std::uint32_t>{} : it->second.acked;
}

std::size_t FakeUploadServer::put_calls() const {
    std::lock_guard lock(mutex_);
    return put_calls_;
}

std::size_t FakeUploadServer::blocked() const {
    std::lock_guard lock(mutex_);
    return blocked_;
}

std::vector<std::string> FakeUploadServer::discarded() const {
    std::lock_guard lock(mutex_);
    return discarded_;
}

std::vector<network::CreateUploadRequest> FakeUploadServer::created() const {
    std::lock_guard lock(mutex_);
    return created_;
}

bool FakeUploadServer::wait_for_blocked(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return blocked_ >= count; });
}

bool FakeUploadServer::wait_for_discard(const std::string& id, std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() {
        for (const auto& discarded : discarded_) {
            if (discarded == id) {
                return true;
            }
        }
        return false;
    });
}

std::optional<Error> FakeUploadServer::take_failure_locked(const std::string& upload_id, std::uint32_t index) {
    for (const auto& key : {std::make_pair(upload_id, index), std::make_pair(std::string(), index)}) {
        auto it = failures_.find(key);
        if (it != failures_.end() && !it->second.empty()) {
            auto error = it->second.front();
            it->second.pop_front();
            return error;
        }
    }
    return std::nullopt;
}

} // namespace rup::testing
