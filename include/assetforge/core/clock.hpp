#pragma once

#include <string>

namespace assetforge::core {
    // UTC wall clock as "YYYY-MM-DDTHH:MM:SS.mmmZ". Fixed width, so the
    // strings order lexically the same as chronologically.
    [[nodiscard]] std::string now_utc_iso();
} // namespace assetforge::core
