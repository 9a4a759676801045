#pragma once

#include "vidup/network/http_types.hpp"
#include "vidup/core/result.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string>

namespace vidup {
namespace network {

/**
 * @brief Where the parser is in the request
 *
 * METHOD SP URL SP VERSION CRLF
 * Header-Name: Header-Value CRLF   (repeated)
 * CRLF
 * [Body, Content-Length bytes]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR      // PARSE_ERROR rather than ERROR, which Windows defines
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed bytes as they arrive; parse() returns true once a complete request
 * is buffered. The request line and headers are consumed one character at
 * a time, the body in bulk.
 *
 * Two ceilings bound memory per connection: max_header_size for everything
 * before the blank line, and max_body_size for the declared Content-Length.
 * A request over the body ceiling fails as soon as its headers are parsed,
 * before any of its body is buffered, and body_too_large() reports it so
 * the server can answer 413 instead of 400.
 *
 * ```cpp
 * HttpParser parser(32 << 20);
 * auto result = parser.parse(data, len);
 * if (result.is_error()) { ... parser.body_too_large() ... }
 * else if (result.value()) { auto request = parser.take_request(); }
 * ```
 */
class HttpParser {
public:
    static constexpr size_t kDefaultMaxHeaderSize = 64 * 1024;

    explicit HttpParser(size_t max_body_size = std::numeric_limits<size_t>::max(),
                        size_t max_header_size = kDefaultMaxHeaderSize)
        : max_body_size_(max_body_size)
        , max_header_size_(max_header_size) {
        reset();
    }

    /**
     * @return true when the request is complete, false when more data is
     *         needed, or an error describing the malformed input
     */
    Result<bool> parse(const char* data, size_t len) {
        size_t i = 0;
        while (i < len) {
            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
            if (state_ == ParseState::PARSE_ERROR) {
                return Err<bool, std::string>("Parser in error state");
            }

            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_length_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(),
                                     reinterpret_cast<const uint8_t*>(data + i),
                                     reinterpret_cast<const uint8_t*>(data + i + take));
                i += take;
                if (request_.body.size() == expected_body_length_) {
                    state_ = ParseState::COMPLETE;
                }
                continue;
            }

            const char c = data[i++];
            if (++header_bytes_ > max_header_size_) {
                return fail("Request headers exceed " + std::to_string(max_header_size_) + " bytes");
            }
            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD:       ok = parse_method(c); break;
                case ParseState::URL:          ok = parse_url(c); break;
                case ParseState::VERSION:      ok = parse_version(c); break;
                case ParseState::HEADER_NAME:  ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                default: break;
            }
            if (!ok) {
                if (error_.empty()) {
                    error_ = "Malformed request at line " + std::to_string(line_);
                }
                return fail(error_);
            }
        }

        return Ok(state_ == ParseState::COMPLETE);
    }

    /// Moves the buffered request out; the parser must be reset() before reuse
    HttpRequest take_request() {
        return std::move(request_);
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// The declared Content-Length exceeded max_body_size
    bool body_too_large() const {
        return body_too_large_;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        error_.clear();
        expected_body_length_ = 0;
        header_bytes_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    size_t max_body_size_;
    size_t max_header_size_;

    ParseState state_;
    HttpRequest request_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    std::string error_;
    size_t expected_body_length_;
    size_t header_bytes_;
    size_t line_;
    bool last_char_was_cr_;
    bool body_too_large_;

    Result<bool> fail(const std::string& message) {
        state_ = ParseState::PARSE_ERROR;
        return Err<bool, std::string>(message);
    }

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_ = "Unsupported HTTP method: " + buffer_;
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.url = buffer_;
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                error_ = "Unsupported HTTP version: " + buffer_;
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            last_char_was_cr_ = false;
            return finish_headers();
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && (c == ' ' || c == '\t')) {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            while (!buffer_.empty() && (buffer_.back() == ' ' || buffer_.back() == '\t')) {
                buffer_.pop_back();
            }
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    // Blank line reached: decide whether a body follows
    bool finish_headers() {
        if (request_.has_header("Transfer-Encoding")) {
            error_ = "Transfer-Encoding is not supported, send Content-Length";
            return false;
        }

        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        uint64_t length = 0;
        const char* first = content_length.data();
        const char* last = first + content_length.size();
        auto [ptr, ec] = std::from_chars(first, last, length);
        if (ec != std::errc() || ptr != last) {
            error_ = "Invalid Content-Length: " + content_length;
            return false;
        }
        if (length > max_body_size_) {
            body_too_large_ = true;
            error_ = "Request body of " + std::to_string(length) + " bytes exceeds the " +
                     std::to_string(max_body_size_) + " byte limit";
            return false;
        }

        expected_body_length_ = static_cast<size_t>(length);
        if (expected_body_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        state_ = ParseState::BODY;
        return true;
    }
};

} // namespace network
} // namespace vidup
