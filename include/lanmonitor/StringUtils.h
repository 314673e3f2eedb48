/**
 * @file StringUtils.h
 * @brief Small string helpers shared by the parsers and classifiers.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace LanMonitor {

class StringUtils {
public:
    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    }

    static std::string toUpper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return s;
    }

    /// Strip leading and trailing whitespace (ASCII).
    static std::string trim(const std::string& s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
            --end;
        }
        return s.substr(begin, end - begin);
    }

    static bool startsWith(const std::string& s, const std::string& prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    static bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool contains(const std::string& haystack, const std::string& needle) {
        return haystack.find(needle) != std::string::npos;
    }

    /// Case-insensitive substring test (ASCII).
    static bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
        return contains(toLower(haystack), toLower(needle));
    }

    static bool isAllDigits(const std::string& s) {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    }

    /// Split on a single character; empty fields are kept.
    static std::vector<std::string> split(const std::string& s, char delim) {
        std::vector<std::string> out;
        std::string current;
        for (char c : s) {
            if (c == delim) {
                out.push_back(current);
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        out.push_back(current);
        return out;
    }

    /// Split into lines, accepting both "\n" and "\r\n".
    static std::vector<std::string> splitLines(const std::string& s) {
        std::vector<std::string> lines = split(s, '\n');
        for (auto& line : lines) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
        }
        return lines;
    }
};

}  // namespace LanMonitor
