#include "rup/network/http_upload_server.hpp"

#include "support/scripted_http_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>

using namespace rup::network;
using rup::CancellationToken;
using rup::ErrorCode;
using rup::testing::RecordedRequest;
using rup::testing::ScriptedHttpServer;
using rup::testing::ScriptedReply;

namespace {

rup::ServerConfig config_for(const ScriptedHttpServer& server) {
    rup::ServerConfig config;
    config.host = "127.0.0.1";
    config.port = server.port();
    config.base_path = "/api/";
    config.auth_token = "secret";
    config.connect_timeout = std::chrono::milliseconds(2000);
    config.request_timeout = std::chrono::milliseconds(2000);
    return config;
}

ScriptedReply json_reply(int status, const nlohmann::json& body) {
    ScriptedReply reply;
    reply.status = status;
    reply.body = body.dump();
    return reply;
}

} // namespace

TEST(HttpUploadServer, CreateUploadSendsMetadataAndReadsCanonicalId) {
    ScriptedHttpServer http([](const RecordedRequest&) {
        return json_reply(201, {{"uploadId", "srv-7"}, {"chunkSize", 1024}, {"totalChunks", 3}});
    });
    HttpUploadServer server(config_for(http));

    CreateUploadRequest request;
    request.file_name = "report.pdf";
    request.relative_path = "docs/report.pdf";
    request.base_path = "/backups";
    request.total_size = 3000;
    request.chunk_size = 1024;
    request.client_upload_id = "local-1";

    auto created = server.create_upload(request);
    ASSERT_TRUE(created.is_ok()) << created.error().describe();
    EXPECT_EQ(created.value().upload_id, "srv-7");
    EXPECT_EQ(created.value().chunk_size, 1024u);
    EXPECT_EQ(created.value().total_chunks, 3u);

    const auto requests = http.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "POST");
    EXPECT_EQ(requests[0].target, "/api/uploads");
    EXPECT_EQ(requests[0].headers.at("authorization"), "Bearer secret");

    const auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["fileName"], "report.pdf");
    EXPECT_EQ(body["relativePath"], "docs/report.pdf");
    EXPECT_EQ(body["totalSize"], 3000);
    EXPECT_EQ(body["uploadId"], "local-1");
}

TEST(HttpUploadServer, CreateUploadWithoutIdIsValidationError) {
    ScriptedHttpServer http([](const RecordedRequest&) { return json_reply(200, {{"ok", true}}); });
    HttpUploadServer server(config_for(http));

    auto created = server.create_upload(CreateUploadRequest{"a", "a", "/", 1, 1, ""});
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().code, ErrorCode::Validation);
}

TEST(HttpUploadServer, PutChunkSendsRawBytesAndReadsAck) {
    ScriptedHttpServer http([](const RecordedRequest&) { return json_reply(200, {{"ackedIndex", 4}}); });
    HttpUploadServer server(config_for(http));
    CancellationToken token;

    const std::vector<std::uint8_t> bytes{0, 1, 2, 255};
    auto reply = server.put_chunk("id with space", 4, bytes, std::chrono::milliseconds(2000), token);
    ASSERT_TRUE(reply.is_ok()) << reply.error().describe();
    EXPECT_EQ(reply.value().outcome, ChunkOutcome::Acked);
    EXPECT_EQ(reply.value().acked_index, 4u);

    const auto requests = http.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "PUT");
    EXPECT_EQ(requests[0].target, "/api/uploads/id%20with%20space/chunks/4");
    EXPECT_EQ(requests[0].headers.at("content-type"), "application/octet-stream");
    EXPECT_EQ(requests[0].body, std::string("\x00\x01\x02\xff", 4));
}

TEST(HttpUploadServer, ConflictMeansAlreadyAcked) {
    ScriptedHttpServer http([](const RecordedRequest&) { return ScriptedReply{409}; });
    HttpUploadServer server(config_for(http));
    CancellationToken token;

    auto reply = server.put_chunk("u-1", 2, {9}, std::chrono::milliseconds(2000), token);
    ASSERT_TRUE(reply.is_ok());
    EXPECT_EQ(reply.value().outcome, ChunkOutcome::AlreadyAcked);
    EXPECT_EQ(reply.value().acked_index, 2u);
}

TEST(HttpUploadServer, StatusCodesMapToErrorTaxonomy) {
    std::atomic<int> next_status{401};
    ScriptedHttpServer http([&](const RecordedRequest&) {
        return json_reply(next_status.load(), {{"message", "nope"}});
    });
    HttpUploadServer server(config_for(http));
    CancellationToken token;

    auto auth = server.put_chunk("u-1", 0, {1}, std::chrono::milliseconds(2000), token);
    ASSERT_TRUE(auth.is_error());
    EXPECT_EQ(auth.error().code, ErrorCode::Authentication);
    EXPECT_NE(auth.error().message.find("nope"), std::string::npos);

    next_status = 503;
    auto busy = server.put_chunk("u-1", 0, {1}, std::chrono::milliseconds(2000), token);
    ASSERT_TRUE(busy.is_error());
    EXPECT_EQ(busy.error().code, ErrorCode::Transient);

    next_status = 400;
    auto bad = server.put_chunk("u-1", 0, {1}, std::chrono::milliseconds(2000), token);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::Validation);
}

TEST(HttpUploadServer, ClassifyHttpStatus) {
    EXPECT_EQ(classify_http_status(403, "").code, ErrorCode::Authentication);
    EXPECT_EQ(classify_http_status(404, "").code, ErrorCode::NotFound);
    EXPECT_EQ(classify_http_status(408, "").code, ErrorCode::Transient);
    EXPECT_EQ(classify_http_status(429, "").code, ErrorCode::Transient);
    EXPECT_EQ(classify_http_status(502, "").code, ErrorCode::Transient);
    EXPECT_EQ(classify_http_status(413, "").code, ErrorCode::Validation);
    EXPECT_EQ(classify_http_status(500, "boom").message, "HTTP 500 boom");
}

TEST(HttpUploadServer, GetStatusParsesUploadedChunks) {
    ScriptedHttpServer http([](const RecordedRequest&) {
        return json_reply(200, {{"uploadId", "u-1"}, {"status", "uploading"}, {"totalChunks", 5},
                                {"uploadedChunks", {0, 1, 3}}});
    });
    HttpUploadServer server(config_for(http));

    auto status = server.get_status("u-1");
    ASSERT_TRUE(status.is_ok()) << status.error().describe();
    EXPECT_EQ(status.value().total_chunks, 5u);
    EXPECT_EQ(status.value().status, "uploading");
    EXPECT_EQ(status.value().acked_chunks, (std::vector<std::uint32_t>{0, 1, 3}));
    EXPECT_EQ(http.requests()[0].method, "GET");
    EXPECT_EQ(http.requests()[0].target, "/api/uploads/u-1");
}

TEST(HttpUploadServer, GetStatusUnknownIdIsNotFound) {
    ScriptedHttpServer http([](const RecordedRequest&) { return ScriptedReply{404}; });
    HttpUploadServer server(config_for(http));

    auto status = server.get_status("gone");
    ASSERT_TRUE(status.is_error());
    EXPECT_EQ(status.error().code, ErrorCode::NotFound);
}

TEST(HttpUploadServer, DiscardToleratesMissingUpload) {
    ScriptedHttpServer http([](const RecordedRequest&) { return ScriptedReply{404}; });
    HttpUploadServer server(config_for(http));

    EXPECT_TRUE(server.discard("gone").is_ok());
    EXPECT_EQ(http.requests()[0].method, "DELETE");
}

TEST(HttpUploadServer, BodyWithoutContentLengthIsReadToEof) {
    ScriptedHttpServer http([](const RecordedRequest&) {
        auto reply = json_reply(200, {{"uploadId", "eof-1"}});
        reply.omit_content_length = true;
        return reply;
    });
    HttpUploadServer server(config_for(http));

    auto created = server.create_upload(CreateUploadRequest{"a", "a", "/", 1, 1, ""});
    ASSERT_TRUE(created.is_ok()) << created.error().describe();
    EXPECT_EQ(created.value().upload_id, "eof-1");
}

TEST(HttpUploadServer, SlowReplyTimesOut) {
    ScriptedHttpServer http([](const RecordedRequest&) {
        ScriptedReply reply;
        reply.delay = std::chrono::milliseconds(2000);
        return reply;
    });
    HttpUploadServer server(config_for(http));
    CancellationToken token;

    const auto start = std::chrono::steady_clock::now();
    auto reply = server.put_chunk("u-1", 0, {1}, std::chrono::milliseconds(100), token);
    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().code, ErrorCode::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(1500));
}

TEST(HttpUploadServer, CancellationAbortsInFlightRequest) {
    ScriptedHttpServer http([](const RecordedRequest&) {
        ScriptedReply reply;
        reply.delay = std::chrono::milliseconds(3000);
        return reply;
    });
    HttpUploadServer server(config_for(http));
    CancellationToken token;

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();
    });
    auto reply = server.put_chunk("u-1", 0, {1}, std::chrono::milliseconds(10000), token);
    canceller.join();

    ASSERT_TRUE(reply.is_error());
    EXPECT_EQ(reply.error().code, ErrorCode::Cancelled);
}

TEST(HttpUploadServer, UnreachableServerIsTransient) {
    std::uint16_t closed_port = 0;
    {
        ScriptedHttpServer probe([](const RecordedRequest&) { return ScriptedReply{}; });
        closed_port = probe.port();
    }
    rup::ServerConfig config;
    config.port = closed_port;
    config.connect_timeout = std::chrono::milliseconds(500);
    HttpUploadServer server(config);

    auto status = server.get_status("u-1");
    ASSERT_TRUE(status.is_error());
    EXPECT_TRUE(rup::is_retryable(status.error().code));
}
