#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace ql::types {

struct ListQueryParams {
    static constexpr int64_t DEFAULT_LIMIT = 50;
    static constexpr int64_t MAX_LIMIT = 500;

    std::optional<int64_t> limit;
    std::optional<int64_t> offset;

    [[nodiscard]] int64_t effectiveLimit() const {
        return std::clamp<int64_t>(limit.value_or(DEFAULT_LIMIT), 1, MAX_LIMIT);
    }

    [[nodiscard]] int64_t effectiveOffset() const { return std::max<int64_t>(offset.value_or(0), 0); }

    // Throws std::invalid_argument on non-numeric values.
    static ListQueryParams fromQuery(const std::unordered_map<std::string, std::string>& query);
};

}
