#include "assetforge/identity/tag.hpp"
#include "assetforge/db/schema.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstring>

namespace assetforge::identity {
    namespace {
        [[nodiscard]] bool is_code_char(char c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        }

        [[nodiscard]] bool all_digits(const char* s, size_t len) noexcept {
            if (len == 0) {
                return false;
            }
            for (size_t i = 0; i < len; ++i) {
                if (s[i] < '0' || s[i] > '9') {
                    return false;
                }
            }
            return true;
        }

        // Splits "SDMM-<code>-<digits>" in place; false on any shape mismatch.
        [[nodiscard]] bool split_tag(const std::string& tag, std::string* code, const char** digits, size_t* digits_len) noexcept {
            const size_t prefix_len = std::strlen(assetforge::db::kTagPrefix);
            if (tag.size() < prefix_len + 1 || tag.compare(0, prefix_len, assetforge::db::kTagPrefix) != 0 ||
                tag[prefix_len] != '-') {
                return false;
            }
            const size_t code_start = prefix_len + 1;
            const size_t dash = tag.find('-', code_start);
            if (dash == std::string::npos || dash == code_start) {
                return false;
            }
            *code = tag.substr(code_start, dash - code_start);
            if (!type_code_valid(code->c_str())) {
                return false;
            }
            *digits = tag.c_str() + dash + 1;
            *digits_len = tag.size() - dash - 1;
            return *digits_len >= static_cast<size_t>(kSerialMinDigits) && all_digits(*digits, *digits_len);
        }
    } // namespace

    bool type_code_valid(const char* code) noexcept {
        if (code == nullptr) {
            return false;
        }
        const size_t len = std::strlen(code);
        if (len == 0 || len > kTypeCodeMaxLen) {
            return false;
        }
        for (size_t i = 0; i < len; ++i) {
            if (!is_code_char(code[i])) {
                return false;
            }
        }
        return true;
    }

    assetforge::core::Status tag_derive(const char* code, i64 serial, std::string* out) noexcept {
        if (out == nullptr) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Invalid);
        }
        if (!type_code_valid(code) || serial < 1) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Corrupt);
        }

        char buf[64];
        const int n = std::snprintf(buf, sizeof(buf), "%s-%s-%0*lld",
                                    assetforge::db::kTagPrefix, code, kSerialMinDigits,
                                    static_cast<long long>(serial));
        if (n <= 0 || static_cast<size_t>(n) >= sizeof(buf)) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Corrupt);
        }

        std::string tag(buf, static_cast<size_t>(n));
        if (!tag_well_formed(tag)) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Corrupt);
        }
        *out = std::move(tag);
        return assetforge::core::ok_status();
    }

    bool tag_well_formed(const std::string& tag) noexcept {
        std::string code;
        const char* digits = nullptr;
        size_t digits_len = 0;
        return split_tag(tag, &code, &digits, &digits_len);
    }

    assetforge::core::Status tag_parse(const std::string& tag, TagParts* out) noexcept {
        if (out == nullptr) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Invalid);
        }
        std::string code;
        const char* digits = nullptr;
        size_t digits_len = 0;
        if (!split_tag(tag, &code, &digits, &digits_len)) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Invalid);
        }

        i64 serial = 0;
        const auto r = std::from_chars(digits, digits + digits_len, serial, 10);
        if (r.ec != std::errc() || r.ptr != digits + digits_len || serial < 1) {
            return assetforge::core::make_status(assetforge::core::StatusDomain::Identity, assetforge::core::StatusCode::Invalid);
        }

        out->code = std::move(code);
        out->serial = serial;
        return assetforge::core::ok_status();
    }

    std::string tag_normalize(const std::string& text) {
        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
            --end;
        }
        std::string out = text.substr(begin, end - begin);
        for (char& c : out) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return out;
    }
} // namespace assetforge::identity
