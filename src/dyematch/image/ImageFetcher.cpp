#include <dyematch/image/ImageFetcher.hpp>

#include <charconv>

namespace DM::Image {

namespace {

auto parse_content_length(std::string const& value) -> std::optional<std::int64_t> {
    std::int64_t parsed = 0;
    auto         result = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (result.ec != std::errc{} || parsed < 0) {
        return std::nullopt;
    }
    return parsed;
}

auto is_redirect(int status) -> bool {
    return status >= 300 && status < 400;
}

auto fetch_failed(int status, std::string message) -> Error {
    Error error{Error::Code::FetchFailed, std::move(message)};
    error.http_status = status;
    return error;
}

} // namespace

ImageFetcher::ImageFetcher(UrlGuard const& guard, HttpTransport& transport, FetchOptions options, LogSink& log)
    : guard_(guard), transport_(transport), options_(std::move(options)), log_(log) {}

auto ImageFetcher::fetch(ValidatedUrl const& url) -> Expected<FetchedImage> {
    auto const   deadline = std::chrono::steady_clock::now() + options_.timeout;
    FetchedImage fetched;
    if (auto status = fetch_once(url, deadline, true, fetched); !status) {
        log_.warn("Fetch", describeError(status.error()));
        return std::unexpected(std::move(status.error()));
    }
    return fetched;
}

auto ImageFetcher::fetch_once(ValidatedUrl const& url, std::chrono::steady_clock::time_point deadline, bool allow_redirect,
                              FetchedImage& out) -> Expected<void> {
    if (std::chrono::steady_clock::now() >= deadline) {
        return std::unexpected(Error{Error::Code::FetchTimeout, "Image download timed out"});
    }

    std::optional<std::int64_t> declared;

    TransportRequest request;
    request.deadline       = deadline;
    request.max_body_bytes = options_.limits.max_file_size_bytes;
    request.headers        = {{"User-Agent", options_.user_agent}, {"Accept", "image/*"}};
    request.inspect_head   = [&](int status, HeaderMap const& headers) -> std::optional<Error> {
        if (is_redirect(status)) {
            return std::nullopt;
        }
        auto length = find_header(headers, "content-length");
        if (!length) {
            return std::nullopt;
        }
        declared = parse_content_length(*length);
        if (declared && *declared > options_.limits.max_file_size_bytes) {
            if (auto tooLarge = check_file_size(*declared, options_.limits); !tooLarge) {
                return tooLarge.error();
            }
        }
        return std::nullopt;
    };

    auto response = transport_.get(url, request);
    if (!response) {
        return std::unexpected(std::move(response.error()));
    }

    if (is_redirect(response->status)) {
        if (!allow_redirect) {
            return std::unexpected(fetch_failed(response->status, "Too many redirects"));
        }
        auto location = find_header(response->headers, "location");
        if (!location || location->empty()) {
            return std::unexpected(fetch_failed(response->status, "Redirect without a Location header"));
        }
        auto next = resolve_redirect(url, *location);
        if (!next) {
            return std::unexpected(std::move(next.error()));
        }
        log_.info("Fetch", "following redirect to " + next->normalized_url());
        out.redirected = true;
        return fetch_once(*next, deadline, false, out);
    }

    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(fetch_failed(response->status, "Failed to fetch image (HTTP " + std::to_string(response->status) + ")"));
    }

    if (auto size = check_file_size(static_cast<std::int64_t>(response->body.size()), options_.limits); !size) {
        return std::unexpected(std::move(size.error()));
    }

    out.bytes                   = std::move(response->body);
    out.declared_content_length = declared;
    out.final_url               = url.normalized_url();
    return {};
}

auto ImageFetcher::resolve_redirect(ValidatedUrl const& from, std::string const& location) const -> Expected<ValidatedUrl> {
    std::string absolute = location;
    // Origin-relative targets stay on the same host; anything else must be absolute.
    if (location.starts_with('/') && !location.starts_with("//")) {
        absolute = from.scheme() + "://" + from.host();
        if (from.port() != 443) {
            absolute += ":" + std::to_string(from.port());
        }
        absolute += location;
    }

    auto validated = guard_.validate(absolute);
    if (!validated) {
        Error error{Error::Code::UnsafeRedirect, "Redirect target is not allowed"};
        error.cause = validated.error().message;
        return std::unexpected(std::move(error));
    }
    return validated;
}

} // namespace DM::Image
