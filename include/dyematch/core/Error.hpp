#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace DM {

struct Error {
    enum class Code {
        InvalidUrl = 0,
        UnsafeRedirect,
        FetchTimeout,
        FetchFailed,
        TooLarge,
        InvalidImage,
        UnsupportedFormat,
        DecodeFailed,
        NoColorsExtracted,
        NoMatchFound,
        RasterizeFailed,
        MalformedInput
    };

    // Which ceiling a TooLarge error tripped.
    enum class Limit {
        Bytes,
        Dimensions,
        PixelCount
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
    std::optional<int>         http_status;
    std::optional<Limit>       limit;
    std::optional<std::string> cause;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidUrl:
        return "invalid_url";
    case Error::Code::UnsafeRedirect:
        return "unsafe_redirect";
    case Error::Code::FetchTimeout:
        return "fetch_timeout";
    case Error::Code::FetchFailed:
        return "fetch_failed";
    case Error::Code::TooLarge:
        return "too_large";
    case Error::Code::InvalidImage:
        return "invalid_image";
    case Error::Code::UnsupportedFormat:
        return "unsupported_format";
    case Error::Code::DecodeFailed:
        return "decode_failed";
    case Error::Code::NoColorsExtracted:
        return "no_colors_extracted";
    case Error::Code::NoMatchFound:
        return "no_match_found";
    case Error::Code::RasterizeFailed:
        return "rasterize_failed";
    case Error::Code::MalformedInput:
        return "malformed_input";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto limitToString(Error::Limit limit) -> std::string_view {
    switch (limit) {
    case Error::Limit::Bytes:
        return "bytes";
    case Error::Limit::Dimensions:
        return "dimensions";
    case Error::Limit::PixelCount:
        return "pixel_count";
    }
    return "unknown";
}

// Full detail for logs: code, message, then any status/limit/cause annotations.
[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const  label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(*error.message);
    }
    if (error.http_status) {
        description.append(" [status=");
        description.append(std::to_string(*error.http_status));
        description.push_back(']');
    }
    if (error.limit) {
        description.append(" [limit=");
        description.append(limitToString(*error.limit));
        description.push_back(']');
    }
    if (error.cause && !error.cause->empty()) {
        description.append(" [cause=");
        description.append(*error.cause);
        description.push_back(']');
    }
    return description;
}

} // namespace DM
