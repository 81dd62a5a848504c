#include "lanshare/network/http_client.hpp"
#include "lanshare/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <sstream>

namespace lanshare {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr size_t kMaxHeadBytes = 64 * 1024;

bool is_unreachable(const boost::system::error_code& ec) {
    return ec == asio::error::connection_refused ||
           ec == asio::error::host_unreachable ||
           ec == asio::error::network_unreachable ||
           ec == asio::error::connection_reset ||
           ec == asio::error::connection_aborted ||
           ec == asio::error::broken_pipe ||
           ec == asio::error::eof ||
           ec == asio::error::host_not_found ||
           ec == asio::error::host_not_found_try_again ||
           ec == asio::error::no_data ||
           ec == asio::error::not_connected;
}

} // namespace

struct HttpResponseStream::Impl {
    asio::io_context io;
    tcp::socket socket{io};
    asio::streambuf buffer{kMaxHeadBytes};
    std::chrono::milliseconds timeout{15000};
    std::string endpoint;
    HttpResponseHead head;
    std::optional<uint64_t> content_length;
    uint64_t received = 0;
    bool finished = false;

    /**
     * @brief Run the operation started by `start` for at most `timeout`
     *
     * `start` receives a completion handler that records the result.
     */
    template<typename Start>
    boost::system::error_code run(Start&& start, std::size_t* transferred, bool& timed_out) {
        boost::system::error_code result = asio::error::would_block;
        std::size_t bytes = 0;
        timed_out = false;

        start([&result, &bytes](const boost::system::error_code& ec, std::size_t n) {
            result = ec;
            bytes = n;
        });

        io.restart();
        io.run_for(timeout);

        if (!io.stopped()) {
            // Deadline hit: cancel by closing, then let the handler run
            boost::system::error_code ignored;
            socket.close(ignored);
            io.run();
            timed_out = true;
        }

        if (transferred) {
            *transferred = bytes;
        }
        return result;
    }

    Error io_error(const std::string& step, const boost::system::error_code& ec, bool timed_out) const {
        if (timed_out) {
            return Error(ErrorCode::Timeout, step + " " + endpoint + " timed out");
        }
        if (is_unreachable(ec)) {
            return Error(ErrorCode::Unreachable, step + " " + endpoint + " failed: " + ec.message());
        }
        return Error(ErrorCode::Unexpected, step + " " + endpoint + " failed: " + ec.message());
    }

    Outcome<size_t> read_some(uint8_t* out, size_t capacity) {
        if (finished || capacity == 0) {
            return Ok(size_t{0});
        }

        size_t want = capacity;
        if (content_length) {
            const uint64_t remaining = *content_length - received;
            if (remaining == 0) {
                finished = true;
                return Ok(size_t{0});
            }
            want = static_cast<size_t>(std::min<uint64_t>(want, remaining));
        }

        // Bytes that arrived together with the head
        if (buffer.size() > 0) {
            const size_t n = std::min(want, buffer.size());
            std::memcpy(out, buffer.data().data(), n);
            buffer.consume(n);
            received += n;
            return Ok(n);
        }

        bool timed_out = false;
        std::size_t n = 0;
        auto ec = run([this, out, want](auto handler) {
            socket.async_read_some(asio::buffer(out, want), handler);
        }, &n, timed_out);

        if (!ec || (ec == asio::error::eof && n > 0)) {
            received += n;
            return Ok(n);
        }

        if (ec == asio::error::eof && !timed_out) {
            finished = true;
            if (content_length && received < *content_length) {
                return Fail<size_t>(ErrorCode::Unreachable,
                    "Connection to " + endpoint + " closed after " + std::to_string(received) +
                    " of " + std::to_string(*content_length) + " bytes");
            }
            return Ok(size_t{0});
        }

        return Err<size_t>(io_error("Reading from", ec, timed_out));
    }
};

HttpResponseStream::HttpResponseStream(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {
}

HttpResponseStream::~HttpResponseStream() {
    close();
}

const HttpResponseHead& HttpResponseStream::head() const {
    return impl_->head;
}

Outcome<size_t> HttpResponseStream::read_some(uint8_t* buffer, size_t capacity) {
    return impl_->read_some(buffer, capacity);
}

Outcome<std::vector<uint8_t>> HttpResponseStream::read_all(size_t limit) {
    std::vector<uint8_t> body;
    if (impl_->content_length) {
        if (*impl_->content_length > limit) {
            return Fail<std::vector<uint8_t>>(ErrorCode::MalformedResponse,
                "Response body of " + std::to_string(*impl_->content_length) + " bytes exceeds limit");
        }
        body.reserve(static_cast<size_t>(*impl_->content_length));
    }

    std::vector<uint8_t> chunk(64 * 1024);
    while (true) {
        auto n = read_some(chunk.data(), chunk.size());
        if (n.is_error()) {
            return Err<std::vector<uint8_t>>(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        if (body.size() + n.value() > limit) {
            return Fail<std::vector<uint8_t>>(ErrorCode::MalformedResponse, "Response body exceeds limit");
        }
        body.insert(body.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n.value()));
    }
    return Ok(std::move(body));
}

uint64_t HttpResponseStream::bytes_read() const {
    return impl_->received;
}

void HttpResponseStream::close() {
    if (impl_ && impl_->socket.is_open()) {
        boost::system::error_code ignored;
        impl_->socket.shutdown(tcp::socket::shutdown_both, ignored);
        impl_->socket.close(ignored);
    }
}

std::string HttpClient::format_request(const ClientRequest& request) {
    std::ostringstream oss;
    oss << "GET " << request.target << " HTTP/1.1\r\n"
        << "Host: " << request.host << ":" << request.port << "\r\n"
        << "User-Agent: lanshare\r\n"
        << "Connection: close\r\n";
    for (const auto& [name, value] : request.headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

Outcome<std::unique_ptr<HttpResponseStream>> HttpClient::open(const ClientRequest& request) {
    using StreamPtr = std::unique_ptr<HttpResponseStream>;

    auto impl = std::make_unique<HttpResponseStream::Impl>();
    impl->timeout = request.timeout;
    impl->endpoint = request.host + ":" + std::to_string(request.port);

    tcp::resolver resolver(impl->io);
    tcp::resolver::results_type endpoints;
    bool timed_out = false;

    {
        boost::system::error_code result = asio::error::would_block;
        resolver.async_resolve(request.host, std::to_string(request.port),
            [&](const boost::system::error_code& ec, tcp::resolver::results_type found) {
                result = ec;
                endpoints = std::move(found);
            });
        impl->io.restart();
        impl->io.run_for(impl->timeout);
        if (!impl->io.stopped()) {
            resolver.cancel();
            impl->io.run();
            timed_out = true;
        }
        if (result || timed_out) {
            if (!timed_out) {
                return Fail<StreamPtr>(ErrorCode::Unreachable,
                    "Cannot resolve " + request.host + ": " + result.message());
            }
            return Err<StreamPtr>(impl->io_error("Resolving", result, true));
        }
    }

    auto ec = impl->run([&](auto handler) {
        asio::async_connect(impl->socket, endpoints,
            [handler](const boost::system::error_code& e, const tcp::endpoint&) { handler(e, 0); });
    }, nullptr, timed_out);
    if (ec || timed_out) {
        return Err<StreamPtr>(impl->io_error("Connecting to", ec, timed_out));
    }

    const std::string wire = format_request(request);
    ec = impl->run([&](auto handler) {
        asio::async_write(impl->socket, asio::buffer(wire), handler);
    }, nullptr, timed_out);
    if (ec || timed_out) {
        return Err<StreamPtr>(impl->io_error("Sending request to", ec, timed_out));
    }

    std::size_t head_end = 0;
    ec = impl->run([&](auto handler) {
        asio::async_read_until(impl->socket, impl->buffer, "\r\n\r\n", handler);
    }, &head_end, timed_out);
    if (ec == asio::error::not_found) {
        return Fail<StreamPtr>(ErrorCode::MalformedResponse,
            "Response head from " + impl->endpoint + " exceeds " + std::to_string(kMaxHeadBytes) + " bytes");
    }
    if (ec || timed_out) {
        return Err<StreamPtr>(impl->io_error("Reading response from", ec, timed_out));
    }

    const char* raw = static_cast<const char*>(impl->buffer.data().data());
    std::string head_text(raw, head_end);
    impl->buffer.consume(head_end);

    auto head = parse_response_head(head_text);
    if (head.is_error()) {
        return Fail<StreamPtr>(ErrorCode::MalformedResponse, impl->endpoint + ": " + head.error());
    }
    impl->head = std::move(head.value());
    impl->content_length = impl->head.content_length();

    std::string transfer_encoding = impl->head.get_header("Transfer-Encoding");
    if (!transfer_encoding.empty() && strcasecmp_cross_platform(transfer_encoding.c_str(), "identity") != 0) {
        return Fail<StreamPtr>(ErrorCode::MalformedResponse,
            "Unsupported Transfer-Encoding from " + impl->endpoint + ": " + transfer_encoding);
    }

    if (impl->head.status_code == static_cast<int>(HttpStatus::SERVICE_UNAVAILABLE)) {
        return Fail<StreamPtr>(ErrorCode::Unreachable, impl->endpoint + " is busy (503)");
    }

    spdlog::debug("GET {}{} -> {}", impl->endpoint, request.target, impl->head.status_code);
    return Ok(std::make_unique<HttpResponseStream>(std::move(impl)));
}

} // namespace network
} // namespace lanshare
