/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_CONSTANTS_HPP
#define DEVALUE_DEVALUE_CONSTANTS_HPP

#include <cstdint>
#include <optional>

namespace devalue {
    // Negative indices reserved by the serializer for values that JSON cannot represent
    enum class sentinel: int64_t {
        undefined         = -1,
        hole              = -2,
        nan               = -3,
        positive_infinity = -4,
        negative_infinity = -5,
        negative_zero     = -6
    };

    constexpr bool is_sentinel(const int64_t idx) noexcept
    {
        return idx <= static_cast<int64_t>(sentinel::undefined) && idx >= static_cast<int64_t>(sentinel::negative_zero);
    }

    constexpr std::optional<sentinel> sentinel_from_index(const int64_t idx) noexcept
    {
        if (is_sentinel(idx))
            return static_cast<sentinel>(idx);
        return {};
    }
}

#endif // !DEVALUE_DEVALUE_CONSTANTS_HPP
