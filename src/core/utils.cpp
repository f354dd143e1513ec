#include "cloudbrowser/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <random>

namespace cloudbrowser::utils {

auto generate_id(std::size_t length) -> std::string {
    static constexpr std::string_view chars =
        "abcdefghijklmnopqrstuvwxyz0123456789";
    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<size_t> dist(0, chars.size() - 1);

    std::string result;
    result.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        result += chars[dist(rng)];
    }
    return result;
}

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

namespace {
constexpr auto make_b64_decode_table() -> std::array<uint8_t, 256> {
    std::array<uint8_t, 256> t{};
    for (int i = 0; i < 26; ++i) t['A' + i] = static_cast<uint8_t>(i);
    for (int i = 0; i < 26; ++i) t['a' + i] = static_cast<uint8_t>(26 + i);
    for (int i = 0; i < 10; ++i) t['0' + i] = static_cast<uint8_t>(52 + i);
    t['+'] = 62;
    t['/'] = 63;
    return t;
}
} // namespace

auto base64_decode(std::string_view data) -> std::string {
    static constexpr auto table = make_b64_decode_table();

    std::string result;
    result.reserve((data.size() / 4) * 3);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : data) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        buf = (buf << 6) | table[static_cast<uint8_t>(c)];
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result += static_cast<char>((buf >> bits) & 0xFF);
        }
    }
    return result;
}

auto base64_encode(std::string_view data) -> std::string {
    static constexpr std::string_view chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : data) {
        buf = (buf << 8) | static_cast<uint8_t>(c);
        bits += 8;
        while (bits >= 6) {
            bits -= 6;
            result += chars[(buf >> bits) & 0x3F];
        }
    }
    if (bits > 0) {
        result += chars[(buf << (6 - bits)) & 0x3F];
    }
    while (result.size() % 4 != 0) {
        result += '=';
    }
    return result;
}

auto url_scheme(std::string_view url) -> std::string {
    auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) return "";

    auto scheme = url.substr(0, sep);
    if (!std::isalpha(static_cast<unsigned char>(scheme.front()))) return "";
    for (char c : scheme) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '+' && c != '-' && c != '.') return "";
    }

    auto rest = url.substr(sep + 3);
    auto authority = rest.substr(0, rest.find_first_of("/?#"));
    if (authority.empty() || authority.find_first_of(" \t") != std::string_view::npos) {
        return "";
    }
    // "user:pass@" alone has no host
    auto at = authority.rfind('@');
    if (at != std::string_view::npos && at + 1 == authority.size()) return "";

    return to_lower(scheme);
}

auto redact_url_credentials(std::string_view url) -> std::string {
    auto sep = url.find("://");
    if (sep == std::string_view::npos) return std::string(url);

    auto authority_start = sep + 3;
    auto authority_end = url.find_first_of("/?#", authority_start);
    auto at = url.rfind('@', authority_end);
    if (at == std::string_view::npos || at < authority_start) return std::string(url);

    auto colon = url.find(':', authority_start);
    if (colon == std::string_view::npos || colon > at) return std::string(url);

    std::string result(url.substr(0, colon + 1));
    result += "***";
    result += url.substr(at);
    return result;
}

} // namespace cloudbrowser::utils
