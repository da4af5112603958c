// umedia - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <chrono>

namespace umedia::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatIso8601(std::chrono::system_clock::time_point time);

    // Identifiers
    static std::string generateUUID();
    static std::string generateHexId(); // UUID without dashes

    // Validation
    static bool isNumeric(const std::string& str);
};

} // namespace umedia::utils
