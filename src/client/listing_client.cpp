#include "lanshare/client/listing_client.hpp"
#include "lanshare/codec/gzip.hpp"
#include "lanshare/events/events.hpp"
#include "lanshare/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace lanshare::client {

using index::Listing;

namespace {

bool is_gzip_encoding(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered.find("gzip") != std::string::npos;
}

Outcome<Listing> parse_plain(const std::vector<uint8_t>& bytes) {
    auto decoded = index::decode_listing(std::string(bytes.begin(), bytes.end()));
    if (decoded.is_error()) {
        return Fail<Listing>(ErrorCode::MalformedResponse,
                             "Invalid response format from server: " + decoded.error());
    }
    return Ok(std::move(decoded.value()));
}

} // namespace

Outcome<Listing> decode_listing_body(const std::vector<uint8_t>& body, bool gzip_encoded) {
    if (!gzip_encoded) {
        return parse_plain(body);
    }

    auto inflated = codec::gzip_decompress(body);
    if (inflated.is_ok()) {
        return parse_plain(inflated.value());
    }

    // Some intermediaries strip the encoding but keep the header
    auto plain = parse_plain(body);
    if (plain.is_ok()) {
        spdlog::debug("Listing announced gzip but was plain JSON");
        return plain;
    }
    return Fail<Listing>(ErrorCode::DecompressionFailure,
                         "Failed to decompress server response: " + inflated.error());
}

ListingClient::ListingClient(ListingOptions options,
                             std::shared_ptr<ConnectionHealthRegistry> health,
                             events::EventBus* bus)
    : options_(options)
    , health_(health ? std::move(health) : std::make_shared<ConnectionHealthRegistry>())
    , bus_(bus) {
}

Outcome<Listing> ListingClient::list(const Endpoint& endpoint) {
    bool compressed = false;
    uint64_t body_bytes = 0;
    auto result = fetch(endpoint, compressed, body_bytes);
    report(endpoint, result, compressed, body_bytes);
    return result;
}

Outcome<Listing> ListingClient::fetch(const Endpoint& endpoint, bool& compressed, uint64_t& body_bytes) {
    network::ClientRequest request;
    request.host = endpoint.host;
    request.port = endpoint.port;
    request.target = "/api/files";
    request.headers["Accept-Encoding"] = "gzip";
    request.timeout = options_.timeout;

    auto opened = network::HttpClient::open(request);
    if (opened.is_error()) {
        return Err<Listing>(opened.error());
    }
    auto& response = *opened.value();

    if (response.status() != 200) {
        const ErrorCode code = response.status() == 404 ? ErrorCode::NotFound
                             : response.status() == 403 ? ErrorCode::Forbidden
                             : ErrorCode::Unexpected;
        return Fail<Listing>(code, "Server answered HTTP " + std::to_string(response.status()) +
                                   " for the file list");
    }

    auto body = response.read_all(options_.max_body_bytes);
    if (body.is_error()) {
        return Err<Listing>(body.error());
    }

    compressed = is_gzip_encoding(response.head().get_header("Content-Encoding"));
    body_bytes = body.value().size();
    return decode_listing_body(body.value(), compressed);
}

void ListingClient::report(const Endpoint& endpoint, const Outcome<Listing>& result,
                           bool compressed, uint64_t body_bytes) {
    events::EndpointAttemptEvent attempt;
    attempt.host = endpoint.host;
    attempt.port = endpoint.port;
    attempt.success = result.is_ok();

    if (result.is_ok()) {
        health_->record_success(endpoint, result.value().size());
        attempt.file_count = result.value().size();
        events::emit_if(bus_, attempt);
        events::emit_if(bus_, events::ListingFetchedEvent{endpoint.key(), result.value().size(),
                                                          compressed, body_bytes});
        return;
    }

    if (result.error().code == ErrorCode::Unreachable) {
        health_->record_failure(endpoint);
    }
    attempt.error = result.error().message;
    spdlog::warn("Listing {} failed ({}): {}", endpoint.key(),
                 error_code_name(result.error().code), result.error().message);
    events::emit_if(bus_, attempt);
}

} // namespace lanshare::client
