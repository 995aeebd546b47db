#include "mac_address.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace macscout::serial {

namespace {
constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

auto trimLower(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    std::string out(text.substr(begin, end - begin + 1));
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}
}  // namespace

auto formatMac(std::string_view text) -> std::string {
    auto value = trimLower(text);
    const bool bare_hex =
        value.size() == 12 &&
        std::all_of(value.begin(), value.end(), [](char c) {
            return HEX_DIGITS.find(c) != std::string_view::npos;
        });
    if (!bare_hex) {
        return value;
    }

    std::string out;
    out.reserve(17);
    for (size_t i = 0; i < value.size(); i += 2) {
        if (!out.empty()) {
            out.push_back(':');
        }
        out.append(value, i, 2);
    }
    return out;
}

auto formatMac(std::span<const uint8_t> bytes) -> std::string {
    std::string out;
    out.reserve(bytes.size() * 3);
    for (auto byte : bytes) {
        if (!out.empty()) {
            out.push_back(':');
        }
        out.push_back(HEX_DIGITS[byte >> 4]);
        out.push_back(HEX_DIGITS[byte & 0x0F]);
    }
    return out;
}

auto isValidMac(std::string_view text) -> bool {
    if (text.size() != 17) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (i % 3 == 2 ? c != ':' : !std::isxdigit(c)) {
            return false;
        }
    }
    return true;
}

auto extractMac(std::string_view output) -> std::optional<std::string> {
    static const std::regex mac_regex(
        R"(MAC:\s*((?:[0-9A-Fa-f]{2}[:-]){5}[0-9A-Fa-f]{2}))",
        std::regex_constants::icase);

    std::string text(output);
    std::smatch match;
    if (!std::regex_search(text, match, mac_regex) || match.size() < 2) {
        return std::nullopt;
    }
    auto mac = formatMac(match[1].str());
    std::replace(mac.begin(), mac.end(), '-', ':');
    return mac;
}

}  // namespace macscout::serial
