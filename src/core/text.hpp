#pragma once

#include <cctype>
#include <cstring>
#include <string>

namespace assetforge::core::text {
    [[nodiscard]] inline std::string trim(const char* s) {
        if (s == nullptr) {
            return {};
        }
        const char* begin = s;
        const char* end = s + std::strlen(s);
        while (begin < end && std::isspace(static_cast<unsigned char>(*begin))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
            --end;
        }
        return std::string(begin, static_cast<size_t>(end - begin));
    }

    [[nodiscard]] inline std::string trim(const std::string& s) {
        return trim(s.c_str());
    }

    [[nodiscard]] inline std::string upper(std::string s) {
        for (char& c : s) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return s;
    }
} // namespace assetforge::core::text
