#include <dyematch/image/UrlGuard.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>

namespace DM::Image {

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    int         port{0};
    bool        explicit_port{false};
    std::string target;
};

auto to_lower(std::string_view value) -> std::string {
    std::string lowered{value};
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return lowered;
}

auto invalid_url(std::string message) -> std::unexpected<Error> {
    return std::unexpected(Error{Error::Code::InvalidUrl, std::move(message)});
}

auto is_scheme_char(unsigned char ch) -> bool {
    return std::isalnum(ch) != 0 || ch == '+' || ch == '-' || ch == '.';
}

auto parse_port(std::string_view port_view) -> std::optional<int> {
    if (port_view.empty()) {
        return std::nullopt;
    }
    int  parsed = 0;
    auto result = std::from_chars(port_view.data(), port_view.data() + port_view.size(), parsed);
    if (result.ec != std::errc{} || result.ptr != port_view.data() + port_view.size() || parsed <= 0 || parsed > 65535) {
        return std::nullopt;
    }
    return parsed;
}

auto parse_url(std::string_view url) -> std::optional<UrlParts> {
    bool const has_control = std::ranges::any_of(url, [](unsigned char ch) { return ch <= 0x20 || ch == 0x7F; });
    if (has_control) {
        return std::nullopt;
    }

    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::nullopt;
    }
    auto scheme = url.substr(0, scheme_end);
    if (std::isalpha(static_cast<unsigned char>(scheme.front())) == 0
        || !std::ranges::all_of(scheme, [](unsigned char ch) { return is_scheme_char(ch); })) {
        return std::nullopt;
    }

    auto remainder     = url.substr(scheme_end + 3);
    auto authority_end = remainder.find_first_of("/?#");
    auto authority     = remainder.substr(0, authority_end);
    auto rest          = authority_end == std::string_view::npos ? std::string_view{} : remainder.substr(authority_end);
    if (authority.empty() || authority.find('@') != std::string_view::npos) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = to_lower(scheme);

    std::string_view host_view;
    std::string_view port_view;
    bool             has_port = false;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        host_view  = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::nullopt;
            }
            port_view = after.substr(1);
            has_port  = true;
        }
    } else {
        if (authority.find_first_of("[]") != std::string_view::npos) {
            return std::nullopt;
        }
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host_view = authority.substr(0, colon);
            port_view = authority.substr(colon + 1);
            has_port  = true;
        } else {
            host_view = authority;
        }
    }
    if (host_view.empty()) {
        return std::nullopt;
    }
    parts.host = to_lower(host_view);

    parts.port = parts.scheme == "https" ? 443 : 80;
    if (has_port) {
        auto port = parse_port(port_view);
        if (!port) {
            return std::nullopt;
        }
        parts.port          = *port;
        parts.explicit_port = true;
    }

    auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }
    parts.target = std::string{rest};
    if (parts.target.empty() || parts.target.front() != '/') {
        parts.target.insert(parts.target.begin(), '/');
    }
    return parts;
}

} // namespace

UrlGuard::UrlGuard(UrlGuardOptions options)
    : options_(std::move(options)) {
    for (auto& host : options_.allowed_hosts) {
        host = to_lower(host);
    }
}

auto UrlGuard::is_allowed_host(std::string_view host) const -> bool {
    auto lowered = to_lower(host);
    return std::ranges::find(options_.allowed_hosts, lowered) != options_.allowed_hosts.end();
}

auto UrlGuard::validate(std::string_view raw) const -> Expected<ValidatedUrl> {
    if (raw.empty()) {
        return invalid_url("No image URL provided");
    }

    auto parts = parse_url(raw);
    if (!parts) {
        return invalid_url("Invalid URL format");
    }
    if (parts->scheme != "https") {
        return invalid_url("Only HTTPS URLs are allowed");
    }
    if (!is_allowed_host(parts->host)) {
        return invalid_url("Only Discord CDN URLs are allowed for security");
    }
    if (is_private_host(parts->host)) {
        return invalid_url("Private network access is not allowed");
    }

    ValidatedUrl validated;
    validated.scheme_ = parts->scheme;
    validated.host_   = parts->host;
    validated.port_   = parts->port;
    validated.target_ = parts->target;

    std::string normalized = parts->scheme;
    normalized.append("://");
    normalized.append(parts->host);
    if (parts->port != 443) {
        normalized.push_back(':');
        normalized.append(std::to_string(parts->port));
    }
    normalized.append(parts->target);
    validated.normalized_url_ = std::move(normalized);
    return validated;
}

auto is_private_host(std::string_view host) -> bool {
    static std::regex const ipv4_literal{R"(^(\d{1,3}\.){3}\d{1,3}$)"};
    static std::regex const ipv6_literal{R"(^[0-9a-f]*:[0-9a-f:.]*$)", std::regex::icase};
    static std::regex const metadata_hosts{R"(^(169\.254\.169\.254|metadata\.google\.internal|metadata\.azure\.internal)$)",
                                           std::regex::icase};
    static std::regex const private_ranges{
            R"(^(localhost$|127\.|10\.|172\.(1[6-9]|2\d|3[01])\.|192\.168\.|0\.|::1$|fc00:|fe80:|fd[0-9a-f]{2}:))",
            std::regex::icase};

    std::string const candidate{host};
    if (std::regex_match(candidate, ipv4_literal) || std::regex_match(candidate, ipv6_literal)) {
        return true;
    }
    if (std::regex_match(candidate, metadata_hosts)) {
        return true;
    }
    return std::regex_search(candidate, private_ranges);
}

} // namespace DM::Image
