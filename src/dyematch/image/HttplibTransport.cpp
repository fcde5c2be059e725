#include <dyematch/image/HttplibTransport.hpp>

#include "log/TaggedLogger.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace DM::Image {

namespace {

using Clock = std::chrono::steady_clock;

auto lowercase(std::string value) -> std::string {
    std::ranges::transform(value, value.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

auto fetch_failed(std::string message) -> Error {
    Error error{Error::Code::FetchFailed, std::move(message)};
    error.http_status = 0;
    return error;
}

auto fetch_timeout() -> Error {
    return Error{Error::Code::FetchTimeout, "Image download timed out"};
}

auto remaining_until(Clock::time_point deadline) -> std::chrono::milliseconds {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return std::max(remaining, std::chrono::milliseconds{1});
}

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
void apply_timeouts(httplib::SSLClient& client, std::chrono::milliseconds budget) {
    auto const seconds      = static_cast<time_t>(budget.count() / 1000);
    auto const microseconds = static_cast<time_t>((budget.count() % 1000) * 1000);
    client.set_connection_timeout(seconds, microseconds);
    client.set_read_timeout(seconds, microseconds);
    client.set_write_timeout(seconds, microseconds);
}
#endif

} // namespace

auto HttplibTransport::get(ValidatedUrl const& url, TransportRequest const& request) -> Expected<TransportResponse> {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
    if (Clock::now() >= request.deadline) {
        return std::unexpected(fetch_timeout());
    }

    httplib::SSLClient client(url.host(), url.port());
    client.enable_server_certificate_verification(true);
    apply_timeouts(client, remaining_until(request.deadline));
    client.set_follow_location(false);
    client.set_keep_alive(false);

    httplib::Headers headers;
    for (auto const& [name, value] : request.headers) {
        headers.emplace(name, value);
    }

    TransportResponse     response;
    std::optional<Error>  abort_reason;

    auto on_head = [&](httplib::Response const& head) -> bool {
        response.status = head.status;
        for (auto const& [name, value] : head.headers) {
            response.headers.emplace(lowercase(name), value);
        }
        dm_log("status " + std::to_string(head.status) + " from " + url.host(), "Fetch.Head", "DEBUG");
        if (request.inspect_head) {
            abort_reason = request.inspect_head(response.status, response.headers);
        }
        return !abort_reason.has_value();
    };

    auto on_body = [&](char const* data, std::size_t length) -> bool {
        if (Clock::now() >= request.deadline) {
            abort_reason = fetch_timeout();
            return false;
        }
        auto const total = static_cast<std::int64_t>(response.body.size() + length);
        if (request.max_body_bytes > 0 && total > request.max_body_bytes) {
            Error error{Error::Code::TooLarge, "Image exceeds the download size limit"};
            error.limit  = Error::Limit::Bytes;
            abort_reason = std::move(error);
            return false;
        }
        auto const* bytes = reinterpret_cast<std::uint8_t const*>(data);
        response.body.insert(response.body.end(), bytes, bytes + length);
        return true;
    };

    auto result = client.Get(url.target(), headers, on_head, on_body);
    if (abort_reason) {
        return std::unexpected(std::move(*abort_reason));
    }
    if (!result) {
        auto const error = result.error();
        if (error == httplib::Error::ConnectionTimeout || Clock::now() >= request.deadline) {
            return std::unexpected(fetch_timeout());
        }
        auto failure  = fetch_failed("Failed to fetch image");
        failure.cause = httplib::to_string(error);
        return std::unexpected(std::move(failure));
    }
    return response;
#else
    (void)url;
    (void)request;
    return std::unexpected(fetch_failed("HTTPS transport unavailable"));
#endif
}

} // namespace DM::Image
