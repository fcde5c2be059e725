#pragma once
#include "dyematch/image/HttpTransport.hpp"

namespace DM::Image {

// cpp-httplib SSLClient with certificate verification, no keep-alive and no redirect following.
class HttplibTransport final : public HttpTransport {
public:
    auto get(ValidatedUrl const& url, TransportRequest const& request) -> Expected<TransportResponse> override;
};

} // namespace DM::Image
