#pragma once

#include "rup/core/result.hpp"

#include <cstdint>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace rup {
namespace network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD  // DELETE collides with a Windows macro
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    REQUEST_TIMEOUT = 408,
    CONFLICT = 409,
    TOO_MANY_REQUESTS = 429,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
        }
        return "GET";
    }
};

/**
 * @brief Outgoing HTTP/1.1 request
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string target;                                   // Path and query, e.g. "/api/uploads/42"
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    void set_body(const std::string& content, const std::string& content_type) {
        body.assign(content.begin(), content.end());
        headers["Content-Type"] = content_type;
    }

    void set_body(std::vector<std::uint8_t> data, const std::string& content_type) {
        body = std::move(data);
        headers["Content-Type"] = content_type;
    }

    std::vector<std::uint8_t> serialize() const {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(method) << " " << target << " HTTP/1.1\r\n";
        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        oss << "Content-Length: " << body.size() << "\r\n\r\n";

        const std::string head = oss.str();
        std::vector<std::uint8_t> result(head.begin(), head.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }
};

/**
 * @brief Incoming HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    std::string get_header(const std::string& name) const {
        for (const auto& [key, value] : headers) {
            if (strcasecmp(key.c_str(), name.c_str()) == 0) {
                return value;
            }
        }
        return "";
    }

    bool has_header(const std::string& name) const {
        return !get_header(name).empty();
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    bool is_success() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief Parses a status line plus headers ending in an empty line
 *
 * The body is not touched; callers read Content-Length bytes afterwards.
 */
Result<HttpResponse> parse_response_head(const std::string& head);

} // namespace network
} // namespace rup
