#pragma once

#include "edgexfer/core/result.hpp"
#include "edgexfer/network/http_types.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>

namespace edgexfer::network {

/**
 * @brief Where the parser is inside the request
 *
 * METHOD SP URL SP VERSION CRLF
 * *(Header-Name: Header-Value CRLF)
 * CRLF
 * [Body of Content-Length bytes]
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Data may arrive in any number of pieces; parse() returns true once the
 * request, including a Content-Length body, is complete. Bodies larger than
 * the configured limit are rejected before any of it is buffered.
 */
class HttpParser {
public:
    static constexpr std::size_t kDefaultMaxBodySize = 128ULL * 1024 * 1024;

    explicit HttpParser(std::size_t max_body_size = kDefaultMaxBodySize)
        : max_body_size_(max_body_size) {
        reset();
    }

    Result<bool, std::string> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            if (state_ == ParseState::BODY) {
                const size_t wanted = expected_body_length_ - request_.body.size();
                const size_t take = std::min(wanted, len - i);
                request_.body.insert(request_.body.end(), data + i, data + i + take);
                i += take - 1;
                if (request_.body.size() >= expected_body_length_) {
                    state_ = ParseState::COMPLETE;
                    return Ok<bool, std::string>(true);
                }
                continue;
            }

            char c = data[i];
            if (c == '\n') {
                line_++;
            }

            bool accepted = true;
            switch (state_) {
                case ParseState::METHOD:
                    accepted = parse_method(c);
                    break;
                case ParseState::URL:
                    accepted = parse_url(c);
                    break;
                case ParseState::VERSION:
                    accepted = parse_version(c);
                    break;
                case ParseState::HEADER_NAME:
                    accepted = parse_header_name(c);
                    break;
                case ParseState::HEADER_VALUE:
                    accepted = parse_header_value(c);
                    break;
                case ParseState::BODY:
                    break;
                case ParseState::COMPLETE:
                    return Ok<bool, std::string>(true);
                case ParseState::PARSE_ERROR:
                    return Err<bool, std::string>(error_.empty() ? "Parser in error state" : error_);
            }

            if (!accepted) {
                if (error_.empty()) {
                    error_ = "Malformed request at line " + std::to_string(line_);
                }
                state_ = ParseState::PARSE_ERROR;
                return Err<bool, std::string>(error_);
            }
            if (state_ == ParseState::COMPLETE) {
                return Ok<bool, std::string>(true);
            }
        }

        return Ok<bool, std::string>(false);
    }

    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    /// True when the failure was an oversized body rather than bad syntax.
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
        line_ = 1;
        last_char_was_cr_ = false;
        body_too_large_ = false;
    }

private:
    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                error_ = "Unsupported method " + buffer_;
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }
        if (!std::isupper(static_cast<unsigned char>(c)) || buffer_.size() >= 16) {
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
        if (!std::isprint(static_cast<unsigned char>(c)) || buffer_.size() >= 8192) {
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
                error_ = "Unsupported version " + buffer_;
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return buffer_.size() <= 16;
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
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }
        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }
        last_char_was_cr_ = false;
        buffer_ += c;
        return buffer_.size() <= 8192;
    }

    bool finish_headers() {
        const std::string content_length = request_.get_header("Content-Length");
        if (content_length.empty()) {
            state_ = ParseState::COMPLETE;
            return true;
        }

        for (char d : content_length) {
            if (!std::isdigit(static_cast<unsigned char>(d))) {
                error_ = "Invalid Content-Length: " + content_length;
                return false;
            }
        }
        if (content_length.size() > 19) {
            error_ = "Content-Length too large";
            body_too_large_ = true;
            return false;
        }

        expected_body_length_ = static_cast<size_t>(std::stoull(content_length));
        if (expected_body_length_ > max_body_size_) {
            error_ = "Body of " + content_length + " bytes exceeds limit of " +
                     std::to_string(max_body_size_);
            body_too_large_ = true;
            return false;
        }
        if (expected_body_length_ == 0) {
            state_ = ParseState::COMPLETE;
            return true;
        }
        request_.body.reserve(expected_body_length_);
        state_ = ParseState::BODY;
        return true;
    }

    size_t max_body_size_;
    ParseState state_ = ParseState::METHOD;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    std::string error_;
    size_t expected_body_length_ = 0;
    size_t line_ = 1;
    bool last_char_was_cr_ = false;
    bool body_too_large_ = false;
};

} // namespace edgexfer::network
