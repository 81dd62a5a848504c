#include "lanshare/network/http_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace lanshare {
namespace network {

namespace {

std::string trim(const std::string& s) {
    const size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

bool is_token_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

} // namespace

void HttpParser::reset() {
    state_ = ParseState::REQUEST_LINE;
    request_ = HttpRequest();
    line_.clear();
    head_bytes_ = 0;
    body_remaining_ = 0;
    line_number_ = 1;
}

Result<bool> HttpParser::fail(const std::string& what) {
    state_ = ParseState::PARSE_ERROR;
    return Err<bool, std::string>(what + " at line " + std::to_string(line_number_));
}

Result<bool> HttpParser::parse(const char* data, size_t len) {
    if (state_ == ParseState::PARSE_ERROR) {
        return Err<bool, std::string>("Parser in error state");
    }

    size_t i = 0;
    while (i < len && state_ != ParseState::COMPLETE) {
        if (state_ == ParseState::BODY) {
            const size_t take = std::min(body_remaining_, len - i);
            request_.body.insert(request_.body.end(),
                                 reinterpret_cast<const uint8_t*>(data + i),
                                 reinterpret_cast<const uint8_t*>(data + i + take));
            body_remaining_ -= take;
            i += take;
            if (body_remaining_ == 0) {
                state_ = ParseState::COMPLETE;
            }
            continue;
        }

        const char c = data[i++];
        if (++head_bytes_ > kMaxHeadBytes) {
            state_ = ParseState::PARSE_ERROR;
            return Err<bool, std::string>("Request head exceeds " +
                                          std::to_string(kMaxHeadBytes) + " bytes");
        }
        if (c != '\n') {
            line_ += c;
            continue;
        }

        // Lines end in CRLF; a bare LF is malformed
        if (line_.empty() || line_.back() != '\r') {
            return fail("Line not terminated by CRLF");
        }
        line_.pop_back();
        const std::string line = std::move(line_);
        line_.clear();

        if (state_ == ParseState::REQUEST_LINE) {
            if (!on_request_line(line)) {
                return fail("Malformed request line");
            }
        } else if (line.empty()) {
            if (!on_head_complete()) {
                return fail("Invalid Content-Length");
            }
        } else if (!on_header_line(line)) {
            return fail("Malformed header");
        }
        line_number_++;
    }

    return Ok(state_ == ParseState::COMPLETE);
}

bool HttpParser::on_request_line(const std::string& line) {
    const size_t first = line.find(' ');
    const size_t last = line.rfind(' ');
    if (first == std::string::npos || first == 0 || last == first || last + 1 == line.size()) {
        return false;
    }

    const std::string method = line.substr(0, first);
    const std::string target = line.substr(first + 1, last - first - 1);
    const std::string version = line.substr(last + 1);

    if (!std::all_of(method.begin(), method.end(),
                     [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; })) {
        return false;
    }
    request_.method = HttpMethodUtils::from_string(method);
    if (request_.method == HttpMethod::UNKNOWN) {
        return false;
    }

    // Printable, no spaces
    if (target.empty() || !std::all_of(target.begin(), target.end(), [](char c) {
            return std::isgraph(static_cast<unsigned char>(c)) != 0;
        })) {
        return false;
    }
    request_.url = target;

    if (version == "HTTP/1.1") {
        request_.version = HttpVersion::HTTP_1_1;
    } else if (version == "HTTP/1.0") {
        request_.version = HttpVersion::HTTP_1_0;
    } else {
        return false;
    }

    state_ = ParseState::HEADERS;
    return true;
}

bool HttpParser::on_header_line(const std::string& line) {
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }
    const std::string name = line.substr(0, colon);
    if (!std::all_of(name.begin(), name.end(), is_token_char)) {
        return false;
    }
    request_.headers[name] = trim(line.substr(colon + 1));
    return true;
}

bool HttpParser::on_head_complete() {
    const std::string content_length = request_.get_header("Content-Length");
    if (content_length.empty()) {
        state_ = ParseState::COMPLETE;
        return true;
    }

    char* end = nullptr;
    const unsigned long long length = std::strtoull(content_length.c_str(), &end, 10);
    if (end == content_length.c_str() || *end != '\0' || length > kMaxBodyBytes) {
        return false;
    }
    body_remaining_ = static_cast<size_t>(length);
    if (body_remaining_ == 0) {
        state_ = ParseState::COMPLETE;
        return true;
    }
    request_.body.reserve(body_remaining_);
    state_ = ParseState::BODY;
    return true;
}

std::optional<uint64_t> HttpResponseHead::content_length() const {
    std::string value = get_header("Content-Length");
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const unsigned long long length = std::strtoull(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<uint64_t>(length);
}

Result<HttpResponseHead> parse_response_head(const std::string& head) {
    HttpResponseHead result;

    size_t line_end = head.find("\r\n");
    if (line_end == std::string::npos) {
        return Err<HttpResponseHead>(std::string("Response has no status line"));
    }

    // HTTP/1.1 SP 206 SP Partial Content
    const std::string status_line = head.substr(0, line_end);
    if (status_line.compare(0, 5, "HTTP/") != 0) {
        return Err<HttpResponseHead>("Not an HTTP response: " + status_line);
    }
    size_t first_space = status_line.find(' ');
    if (first_space == std::string::npos || first_space + 4 > status_line.size()) {
        return Err<HttpResponseHead>("Malformed status line: " + status_line);
    }
    const std::string code = status_line.substr(first_space + 1, 3);
    char* end = nullptr;
    long status = std::strtol(code.c_str(), &end, 10);
    if (end != code.c_str() + 3 || status < 100 || status > 599) {
        return Err<HttpResponseHead>("Malformed status code: " + status_line);
    }
    result.status_code = static_cast<int>(status);
    if (first_space + 5 <= status_line.size()) {
        result.reason_phrase = status_line.substr(first_space + 5);
    }

    size_t pos = line_end + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) {
            next = head.size();
        }
        if (next == pos) {
            break;  // Blank line ends the head
        }

        std::string line = head.substr(pos, next - pos);
        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Err<HttpResponseHead>("Malformed header line: " + line);
        }
        std::string name = line.substr(0, colon);
        size_t value_start = line.find_first_not_of(" \t", colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);
        while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
            value.pop_back();
        }
        result.headers[name] = value;
        pos = next + 2;
    }

    return Ok(std::move(result));
}

} // namespace network
} // namespace lanshare
