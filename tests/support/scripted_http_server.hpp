#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rup::testing {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

struct RecordedRequest {
    std::string method;
    std::string target;
    std::map<std::string, std::string> headers;  ///< Names lower-cased
    std::string body;
};

struct ScriptedReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::milliseconds delay{0};   ///< Wait before answering
    bool omit_content_length = false;     ///< Close the connection to end the body
};

/**
 * @brief Loopback HTTP/1.1 server answering from a handler, one request per connection
 *
 * Runs its own io_context on a background thread and listens on an
 * ephemeral port of 127.0.0.1.
 */
class ScriptedHttpServer {
public:
    using Handler = std::function<ScriptedReply(const RecordedRequest&)>;

    explicit ScriptedHttpServer(Handler handler);
    ~ScriptedHttpServer();

    ScriptedHttpServer(const ScriptedHttpServer&) = delete;
    ScriptedHttpServer& operator=(const ScriptedHttpServer&) = delete;

    std::uint16_t port() const { return port_; }

    std::vector<RecordedRequest> requests() const;

private:
    class Connection;

    void do_accept();
    ScriptedReply handle(const RecordedRequest& request);

    Handler handler_;
    asio::io_context io_;
    tcp::acceptor acceptor_;
    std::uint16_t port_ = 0;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
};

} // namespace rup::testing
