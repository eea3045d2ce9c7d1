/**
 * @file string_utils.hpp
 * @brief String manipulation and destination parsing helpers
 *
 * Small static helpers shared by the validators, the network guard and the
 * audit layer: trimming, case folding, splitting, IPv4/domain recognition
 * and URL host extraction.
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto host = StringUtils::ExtractHost("https://PyPI.org:443/simple?x=1");
 * // host == "pypi.org"
 * if (StringUtils::IsIPv4Address(host)) { ... }
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * String Manipulation
     ***************************************************************************/

    /// Remove leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// Convert to lowercase (ASCII)
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param str Input string
     * @param delimiter Delimiter character
     * @return Tokens (empty tokens skipped)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /// Join strings with delimiter
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /// true if the string is empty or whitespace only
    static bool IsBlank(const std::string& str);

    /// Count newline-separated lines (a trailing line without newline counts)
    static std::size_t CountLines(const std::string& str);

    /**
     * @brief Truncate string to maximum length
     * @param str Input string
     * @param max_length Maximum length including suffix
     * @param suffix Suffix appended when truncated
     */
    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * Destination Recognition
     ***************************************************************************/

    /// Dotted-quad IPv4 address
    static bool IsIPv4Address(const std::string& str);

    /// DNS name with at least one dot and an alphabetic TLD
    static bool IsDomain(const std::string& str);

    /// Has a scheme prefix such as http:// or https://
    static bool IsURL(const std::string& str);

    /**
     * @brief Parse dotted-quad IPv4 into host-order integer
     * @return Address, or std::nullopt if not IPv4
     */
    static std::optional<std::uint32_t> ParseIPv4(const std::string& str);

    /**
     * @brief Parse CIDR notation ("10.0.0.0/8")
     * @return Network address and prefix length, or std::nullopt if malformed
     */
    static std::optional<std::pair<std::uint32_t, int>> ParseCIDR(const std::string& str);

    /**
     * @brief Extract the lowercase host part of a URL or host[:port]
     *
     * Strips scheme, credentials, port, path, query and fragment.
     *
     * @return Host, or empty string if nothing remains
     */
    static std::string ExtractHost(const std::string& destination);
};

} // namespace utils
} // namespace warden
