/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_TAGS_HPP
#define DEVALUE_DEVALUE_TAGS_HPP

#include <cstdint>
#include <optional>
#include <string_view>

namespace devalue {
    enum class builtin_tag: uint8_t {
        date,
        set,
        map,
        null_object,
        regexp,
        object,
        bigint
    };

    extern std::optional<builtin_tag> builtin_tag_from_name(std::string_view name) noexcept;
    extern std::string_view builtin_tag_name(builtin_tag tag) noexcept;
}

#endif // !DEVALUE_DEVALUE_TAGS_HPP
