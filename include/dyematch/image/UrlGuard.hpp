#pragma once
#include "dyematch/core/Error.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DM::Image {

struct UrlGuardOptions {
    // Exact, case-insensitive host allowlist.
    std::vector<std::string> allowed_hosts{"cdn.discordapp.com", "media.discordapp.net"};
};

// Only UrlGuard::validate produces one of these; the fetcher refuses anything else.
class ValidatedUrl {
public:
    [[nodiscard]] auto normalized_url() const -> std::string const& { return normalized_url_; }
    [[nodiscard]] auto scheme() const -> std::string const& { return scheme_; }
    [[nodiscard]] auto host() const -> std::string const& { return host_; }
    [[nodiscard]] auto port() const -> int { return port_; }
    // Path plus query, fragment removed. Never empty.
    [[nodiscard]] auto target() const -> std::string const& { return target_; }

private:
    friend class UrlGuard;
    ValidatedUrl() = default;

    std::string normalized_url_;
    std::string scheme_;
    std::string host_;
    int         port_{443};
    std::string target_;
};

class UrlGuard {
public:
    UrlGuard() = default;
    explicit UrlGuard(UrlGuardOptions options);

    auto validate(std::string_view raw) const -> Expected<ValidatedUrl>;

    [[nodiscard]] auto is_allowed_host(std::string_view host) const -> bool;
    [[nodiscard]] auto options() const -> UrlGuardOptions const& { return options_; }

private:
    UrlGuardOptions options_;
};

// IP literals, cloud metadata names, loopback and RFC 1918 / ULA / link-local ranges.
auto is_private_host(std::string_view host) -> bool;

} // namespace DM::Image
