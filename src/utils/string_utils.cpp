/**
 * @file string_utils.cpp
 * @brief Implementation of string manipulation and destination parsing helpers
 *
 * @date 2025
 */

#include "warden/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace warden {
namespace utils {

// ============================================================================
// STRING MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];
    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

std::size_t StringUtils::CountLines(const std::string& str) {
    if (str.empty()) {
        return 0;
    }
    auto lines = static_cast<std::size_t>(std::count(str.begin(), str.end(), '\n'));
    return str.back() == '\n' ? lines : lines + 1;
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

// ============================================================================
// DESTINATION RECOGNITION
// ============================================================================

bool StringUtils::IsIPv4Address(const std::string& str) {
    return ParseIPv4(str).has_value();
}

bool StringUtils::IsDomain(const std::string& str) {
    static const std::regex domain_pattern(
        R"(^(?:[a-zA-Z0-9](?:[a-zA-Z0-9-]{0,61}[a-zA-Z0-9])?\.)+[a-zA-Z]{2,}$)"
    );
    return str.size() <= 253 && std::regex_match(str, domain_pattern);
}

bool StringUtils::IsURL(const std::string& str) {
    static const std::regex url_pattern(
        R"(^[a-zA-Z][a-zA-Z0-9+.-]*://[^\s]+$)"
    );
    return std::regex_match(str, url_pattern);
}

std::optional<std::uint32_t> StringUtils::ParseIPv4(const std::string& str) {
    std::uint32_t address = 0;
    int octets = 0;
    std::size_t pos = 0;

    while (pos <= str.size()) {
        auto dot = str.find('.', pos);
        auto part = str.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (part.empty() || part.size() > 3 ||
            !std::all_of(part.begin(), part.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        int value = std::stoi(part);
        if (value > 255) {
            return std::nullopt;
        }
        address = (address << 8) | static_cast<std::uint32_t>(value);
        ++octets;
        if (dot == std::string::npos) {
            break;
        }
        pos = dot + 1;
    }

    if (octets != 4) {
        return std::nullopt;
    }
    return address;
}

std::optional<std::pair<std::uint32_t, int>> StringUtils::ParseCIDR(const std::string& str) {
    auto trimmed = Trim(str);
    auto slash = trimmed.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    auto address = ParseIPv4(trimmed.substr(0, slash));
    auto prefix_text = trimmed.substr(slash + 1);
    if (!address || prefix_text.empty() || prefix_text.size() > 2 ||
        !std::all_of(prefix_text.begin(), prefix_text.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    int prefix = std::stoi(prefix_text);
    if (prefix > 32) {
        return std::nullopt;
    }
    return std::make_pair(*address, prefix);
}

std::string StringUtils::ExtractHost(const std::string& destination) {
    std::string host = Trim(destination);

    auto scheme = host.find("://");
    if (scheme != std::string::npos) {
        host = host.substr(scheme + 3);
    }

    // Path, query and fragment
    auto cut = host.find_first_of("/?#");
    if (cut != std::string::npos) {
        host = host.substr(0, cut);
    }

    // Credentials
    auto at = host.rfind('@');
    if (at != std::string::npos) {
        host = host.substr(at + 1);
    }

    // Port
    auto colon = host.rfind(':');
    if (colon != std::string::npos) {
        host = host.substr(0, colon);
    }

    if (!host.empty() && host.back() == '.') {
        host.pop_back();
    }

    return ToLower(host);
}

} // namespace utils
} // namespace warden
