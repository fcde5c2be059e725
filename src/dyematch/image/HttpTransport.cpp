#include <dyematch/image/HttpTransport.hpp>

#include <algorithm>
#include <cctype>

namespace DM::Image {

auto find_header(HeaderMap const& headers, std::string_view name) -> std::optional<std::string> {
    std::string key{name};
    std::ranges::transform(key, key.begin(), [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    if (auto it = headers.find(key); it != headers.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace DM::Image
