/**
 * @file string_utils.hpp
 * @brief String, timestamp and identifier helpers shared across warden
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace warden {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless helpers; all methods are static
 */
class StringUtils {
public:
    static std::string Trim(const std::string& str);

    static std::string Join(const std::vector<std::string>& parts,
                            const std::string& delimiter);

    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Quote an argument for /bin/sh
     *
     * Wraps in single quotes and escapes embedded single quotes, so the
     * result is always a single word.
     */
    static std::string ShellQuote(const std::string& arg);

    /**
     * @brief ISO 8601 UTC with millisecond precision
     *
     * **Example**: "2025-03-14T09:26:53.589Z"
     */
    static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

    /**
     * @brief Random RFC 4122 version 4 UUID
     *
     * Bytes come from OpenSSL's CSPRNG.
     *
     * @throws std::runtime_error if the CSPRNG cannot be seeded
     */
    static std::string GenerateUuid();

    static bool StartsWith(const std::string& str, const std::string& prefix);
};

} // namespace utils
} // namespace warden
