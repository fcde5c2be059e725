#pragma once
#include "dyematch/core/Error.hpp"
#include "dyematch/image/HttpTransport.hpp"
#include "dyematch/image/ImageLimits.hpp"
#include "dyematch/image/UrlGuard.hpp"
#include "dyematch/log/LogSink.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DM::Image {

struct FetchOptions {
    // Wall-clock budget for the whole fetch, redirect hop included.
    std::chrono::milliseconds timeout{10000};
    ImageLimits               limits{};
    std::string               user_agent{"dyematch/1.0"};
};

struct FetchedImage {
    std::vector<std::uint8_t>   bytes;
    std::optional<std::int64_t> declared_content_length;
    std::string                 final_url;
    bool                        redirected{false};
};

class ImageFetcher {
public:
    ImageFetcher(UrlGuard const& guard, HttpTransport& transport, FetchOptions options = {}, LogSink& log = default_log_sink());

    auto fetch(ValidatedUrl const& url) -> Expected<FetchedImage>;

private:
    auto fetch_once(ValidatedUrl const& url, std::chrono::steady_clock::time_point deadline, bool allow_redirect, FetchedImage& out)
            -> Expected<void>;
    auto resolve_redirect(ValidatedUrl const& from, std::string const& location) const -> Expected<ValidatedUrl>;

    UrlGuard const& guard_;
    HttpTransport&  transport_;
    FetchOptions    options_;
    LogSink&        log_;
};

} // namespace DM::Image
