#pragma once

#include "mip/core/result.hpp"
#include "mip/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace mip {
namespace network {

/**
 * @brief Incremental HTTP/1.x request parser
 *
 * Feed bytes as they arrive; parse() returns Ok(true) once the request line,
 * headers and Content-Length body are all in. Chunked bodies are not
 * supported (the control API never needs them).
 */
class HttpParser {
public:
    static constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
    static constexpr std::size_t kMaxBodyBytes = 1024 * 1024;

    HttpParser() { reset(); }

    Result<bool> parse(const char* data, std::size_t len) {
        if (complete_) {
            return Ok(true);
        }
        buffer_.append(data, len);

        if (!headers_done_) {
            const auto end = buffer_.find("\r\n\r\n");
            if (end == std::string::npos) {
                if (buffer_.size() > kMaxHeaderBytes) {
                    return Err<bool, std::string>("Request headers too large");
                }
                return Ok(false);
            }
            auto head = parse_head(buffer_.substr(0, end));
            if (head.is_error()) {
                return Err<bool, std::string>(head.error());
            }
            buffer_.erase(0, end + 4);
            headers_done_ = true;
        }

        if (buffer_.size() < content_length_) {
            return Ok(false);
        }
        request_.body.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(content_length_));
        complete_ = true;
        return Ok(true);
    }

    const HttpRequest& get_request() const { return request_; }
    bool is_complete() const { return complete_; }

    void reset() {
        request_ = HttpRequest();
        buffer_.clear();
        content_length_ = 0;
        headers_done_ = false;
        complete_ = false;
    }

private:
    Result<void> parse_head(const std::string& head) {
        std::size_t line_end = head.find("\r\n");
        const std::string request_line = head.substr(0, line_end);

        const auto first_space = request_line.find(' ');
        const auto last_space = request_line.rfind(' ');
        if (first_space == std::string::npos || last_space == first_space) {
            return Err<void, std::string>("Malformed request line");
        }

        request_.method = HttpMethodUtils::from_string(request_line.substr(0, first_space));
        if (request_.method == HttpMethod::UNKNOWN) {
            return Err<void, std::string>("Unsupported method");
        }
        request_.url = request_line.substr(first_space + 1, last_space - first_space - 1);
        if (request_.url.empty() || request_.url.front() != '/') {
            return Err<void, std::string>("Malformed request target");
        }

        const std::string version = request_line.substr(last_space + 1);
        if (version == "HTTP/1.1") {
            request_.version = HttpVersion::HTTP_1_1;
        } else if (version == "HTTP/1.0") {
            request_.version = HttpVersion::HTTP_1_0;
        } else {
            return Err<void, std::string>("Unsupported HTTP version");
        }

        while (line_end != std::string::npos) {
            const std::size_t start = line_end + 2;
            line_end = head.find("\r\n", start);
            const std::string line = head.substr(start, line_end == std::string::npos ? std::string::npos
                                                                                      : line_end - start);
            const auto colon = line.find(':');
            if (colon == std::string::npos || colon == 0) {
                return Err<void, std::string>("Malformed header line");
            }
            std::string value = line.substr(colon + 1);
            const auto value_start = value.find_first_not_of(" \t");
            value = value_start == std::string::npos ? "" : value.substr(value_start);
            while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
                value.pop_back();
            }
            request_.headers[line.substr(0, colon)] = value;
        }

        const std::string length = request_.get_header("Content-Length");
        if (!length.empty()) {
            if (length.find_first_not_of("0123456789") != std::string::npos) {
                return Err<void, std::string>("Invalid Content-Length");
            }
            try {
                content_length_ = std::stoull(length);
            } catch (const std::out_of_range&) {
                return Err<void, std::string>("Invalid Content-Length");
            }
            if (content_length_ > kMaxBodyBytes) {
                return Err<void, std::string>("Request body too large");
            }
        }
        return Ok();
    }

    HttpRequest request_;
    std::string buffer_;
    std::size_t content_length_ = 0;
    bool headers_done_ = false;
    bool complete_ = false;
};

} // namespace network
} // namespace mip
