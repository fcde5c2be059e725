#pragma once
#include "dyematch/core/Error.hpp"
#include "dyematch/image/UrlGuard.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace DM::Image {

// Header names are stored lowercased.
using HeaderMap = std::map<std::string, std::string>;

struct TransportRequest {
    std::chrono::steady_clock::time_point            deadline{};
    std::int64_t                                     max_body_bytes{0};
    std::vector<std::pair<std::string, std::string>> headers;
    // Runs once status and headers are known and before any body byte is read.
    // Returning an Error aborts the transfer and becomes the result of get().
    std::function<std::optional<Error>(int status, HeaderMap const& headers)> inspect_head;
};

struct TransportResponse {
    int                       status{0};
    HeaderMap                 headers;
    std::vector<std::uint8_t> body;
};

// A single GET, never following redirects. Implementations map their own failures onto
// FetchTimeout (deadline or connect timeout), TooLarge (body ceiling) or FetchFailed.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual auto get(ValidatedUrl const& url, TransportRequest const& request) -> Expected<TransportResponse> = 0;
};

auto find_header(HeaderMap const& headers, std::string_view name) -> std::optional<std::string>;

} // namespace DM::Image
