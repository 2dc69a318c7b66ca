#pragma once

#include <cstddef>
#include <string>

#include "assetforge/core/errors.hpp"
#include "assetforge/core/types.hpp"

namespace assetforge::identity {
    using i64 = assetforge::core::i64;

    inline constexpr std::size_t kTypeCodeMaxLen = 8;
    inline constexpr int kSerialMinDigits = 4;

    struct TagParts {
        std::string code;
        i64 serial{0};
    };

    // 1-8 characters, uppercase ASCII letters and digits.
    [[nodiscard]] bool type_code_valid(const char* code) noexcept;

    // "SDMM-<code>-<serial>", serial zero-padded to at least four digits and
    // widened past 9999. A bad code or a serial below 1 is Corrupt: both come
    // from the store, never from a caller.
    assetforge::core::Status tag_derive(const char* code, i64 serial, std::string* out) noexcept;

    // Shape check only: prefix, a valid code, four or more digits.
    [[nodiscard]] bool tag_well_formed(const std::string& tag) noexcept;

    assetforge::core::Status tag_parse(const std::string& tag, TagParts* out) noexcept;

    // Trims and upper-cases scanner input ("sdmm-lt-0005" -> "SDMM-LT-0005").
    [[nodiscard]] std::string tag_normalize(const std::string& text);

} // namespace assetforge::identity
