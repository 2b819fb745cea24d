#include "rup/network/http_types.hpp"

#include <cctype>

namespace rup {
namespace network {
namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace

Result<HttpResponse> parse_response_head(const std::string& head) {
    std::istringstream stream(head);
    std::string status_line;
    if (!std::getline(stream, status_line)) {
        return Err<HttpResponse>(ErrorCode::Transient, "empty HTTP response");
    }
    status_line = trim(status_line);

    // HTTP/1.1 200 OK
    const auto first_space = status_line.find(' ');
    if (status_line.rfind("HTTP/", 0) != 0 || first_space == std::string::npos) {
        return Err<HttpResponse>(ErrorCode::Transient, "malformed status line: " + status_line);
    }
    const auto second_space = status_line.find(' ', first_space + 1);
    const auto code_text = status_line.substr(first_space + 1, second_space == std::string::npos
                                                                   ? std::string::npos
                                                                   : second_space - first_space - 1);
    if (code_text.size() != 3 || !std::isdigit(static_cast<unsigned char>(code_text[0])) ||
        !std::isdigit(static_cast<unsigned char>(code_text[1])) ||
        !std::isdigit(static_cast<unsigned char>(code_text[2]))) {
        return Err<HttpResponse>(ErrorCode::Transient, "malformed status code: " + code_text);
    }

    HttpResponse response;
    response.status_code = std::stoi(code_text);
    if (second_space != std::string::npos) {
        response.reason_phrase = trim(status_line.substr(second_space + 1));
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty()) {
            break;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return Err<HttpResponse>(ErrorCode::Transient, "malformed header line: " + line);
        }
        response.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return Ok(std::move(response));
}

} // namespace network
} // namespace rup
