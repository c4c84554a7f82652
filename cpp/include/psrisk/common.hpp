#ifndef PSRISK_COMMON_HPP
#define PSRISK_COMMON_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace psrisk {

inline std::string ltrim(std::string value) {
    auto it = std::find_if_not(value.begin(), value.end(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(value.begin(), it);
    return value;
}

inline std::string rtrim(std::string value) {
    auto it = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char ch) {
        return std::isspace(ch) != 0;
    });
    value.erase(it.base(), value.end());
    return value;
}

inline std::string trim(std::string value) {
    return rtrim(ltrim(std::move(value)));
}

inline std::vector<std::string> split(std::string_view value, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char ch : value) {
        if (ch == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    parts.push_back(current);
    return parts;
}

inline std::string strip_quotes(std::string value) {
    if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                              (value.front() == '\'' && value.back() == '\''))) {
        value = value.substr(1, value.size() - 2);
    }
    return value;
}

inline std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string output;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            output += separator;
        }
        output += parts[i];
    }
    return output;
}

// Drops a trailing comment, leaving '#' inside quoted values alone.
inline std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

inline bool parse_bool(const std::string& value) {
    if (value == "true") {
        return true;
    }
    if (value == "false") {
        return false;
    }
    throw std::runtime_error("invalid boolean: " + value);
}

// Accepts ["a", "b"] or a bare comma-separated list.
inline std::vector<std::string> parse_string_list(const std::string& value) {
    std::string body = trim(value);
    if (body.size() >= 2 && body.front() == '[' && body.back() == ']') {
        body = body.substr(1, body.size() - 2);
    }
    std::vector<std::string> items;
    std::string current;
    char quote = 0;
    for (char ch : body) {
        if (quote != 0) {
            if (ch == quote) {
                quote = 0;
            } else {
                current.push_back(ch);
            }
        } else if (ch == '"' || ch == '\'') {
            quote = ch;
        } else if (ch == ',') {
            auto item = trim(current);
            if (!item.empty()) {
                items.push_back(item);
            }
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    auto last = trim(current);
    if (!last.empty()) {
        items.push_back(last);
    }
    return items;
}

inline double seconds_since_epoch() {
    using clock = std::chrono::system_clock;
    auto now = clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

inline std::tm utc_now() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm parts{};
    gmtime_r(&now, &parts);
    return parts;
}

// YYYY-MM-DD in UTC.
inline std::string iso_date() {
    const std::tm parts = utc_now();
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &parts);
    return buffer;
}

inline std::string iso_timestamp() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t seconds = clock::to_time_t(now);
    std::tm parts{};
    gmtime_r(&seconds, &parts);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &parts);
    char output[40];
    std::snprintf(output, sizeof(output), "%s.%03dZ", buffer, static_cast<int>(millis));
    return output;
}

inline bool is_uuid(std::string_view value) {
    if (value.size() != 36) {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (ch != '-') {
                return false;
            }
        } else if (std::isxdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace psrisk

#endif  // PSRISK_COMMON_HPP
