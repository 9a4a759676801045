#pragma once

#include "vidup/core/cancellation.hpp"

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include <strings.h>

namespace vidup {
namespace network {

/**
 * @brief HTTP request methods the parser recognizes
 *
 * Only GET and POST are routed; the rest parse so the router can answer
 * 405 instead of dropping the connection.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_METHOD,  // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpVersion {
    HTTP_1_0,
    HTTP_1_1,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    BAD_REQUEST = 400,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    PAYLOAD_TOO_LARGE = 413,
    INTERNAL_SERVER_ERROR = 500,
    SERVICE_UNAVAILABLE = 503
};

/**
 * @brief A fully buffered HTTP/1.x request
 *
 * The body is binary (multipart chunk data), hence std::vector<uint8_t>.
 * `cancellation` is set by the server for every request: it fires when the
 * request deadline passes or the server begins shutting down.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string url;                                      // Path plus optional query
    HttpVersion version = HttpVersion::HTTP_1_1;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;
    std::shared_ptr<CancellationToken> cancellation;

    /**
     * @brief Header value by case-insensitive name, empty when absent
     */
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

    /// URL without the query string
    std::string path() const {
        const auto query = url.find('?');
        return query == std::string::npos ? url : url.substr(0, query);
    }

    const CancellationToken& cancellation_token() const {
        return cancellation ? *cancellation : CancellationToken::none();
    }
};

struct HttpResponse {
    HttpVersion version = HttpVersion::HTTP_1_1;
    int status_code = 200;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;
    std::vector<uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status)
        : status_code(static_cast<int>(status))
        , reason_phrase(get_reason_phrase(status)) {
    }

    /// Sets the body and Content-Length
    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
        headers["Content-Length"] = std::to_string(body.size());
    }

    void set_header(const std::string& name, const std::string& value) {
        headers[name] = value;
    }

    /**
     * @brief Status line, headers, blank line, body
     */
    std::vector<uint8_t> serialize() const {
        std::ostringstream oss;
        oss << version_to_string(version) << " "
            << status_code << " "
            << reason_phrase << "\r\n";

        for (const auto& [name, value] : headers) {
            oss << name << ": " << value << "\r\n";
        }
        if (headers.find("Content-Length") == headers.end()) {
            oss << "Content-Length: " << body.size() << "\r\n";
        }
        oss << "\r\n";

        std::string header_str = oss.str();
        std::vector<uint8_t> result(header_str.begin(), header_str.end());
        result.insert(result.end(), body.begin(), body.end());
        return result;
    }

    static std::string get_reason_phrase(HttpStatus status) {
        switch (status) {
            case HttpStatus::OK: return "OK";
            case HttpStatus::BAD_REQUEST: return "Bad Request";
            case HttpStatus::NOT_FOUND: return "Not Found";
            case HttpStatus::METHOD_NOT_ALLOWED: return "Method Not Allowed";
            case HttpStatus::PAYLOAD_TOO_LARGE: return "Payload Too Large";
            case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
            case HttpStatus::SERVICE_UNAVAILABLE: return "Service Unavailable";
        }
        return "Unknown";
    }

    static std::string version_to_string(HttpVersion version) {
        switch (version) {
            case HttpVersion::HTTP_1_0: return "HTTP/1.0";
            case HttpVersion::HTTP_1_1: return "HTTP/1.1";
            default: return "HTTP/1.1";
        }
    }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method_str) {
        if (method_str == "GET") return HttpMethod::GET;
        if (method_str == "POST") return HttpMethod::POST;
        if (method_str == "PUT") return HttpMethod::PUT;
        if (method_str == "DELETE") return HttpMethod::DELETE_METHOD;
        if (method_str == "HEAD") return HttpMethod::HEAD;
        if (method_str == "OPTIONS") return HttpMethod::OPTIONS;
        return HttpMethod::UNKNOWN;
    }

    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
            case HttpMethod::OPTIONS: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }
};

} // namespace network
} // namespace vidup
