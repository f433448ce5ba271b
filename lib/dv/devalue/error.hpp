/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_ERROR_HPP
#define DEVALUE_DEVALUE_ERROR_HPP

#include <cstdint>
#include <dv/common/format.hpp>

namespace devalue {
    // a malformed envelope or a malformed payload of a known tag
    struct invalid_input: error {
        using error::error;
    };

    struct index_out_of_range: error {
        explicit index_out_of_range(const uint64_t idx, const size_t size):
            error { fmt::format("chunk index {} is out of range: the input has {} chunks", idx, size) },
            _idx { idx }, _size { size }
        {
        }

        uint64_t index() const noexcept
        {
            return _idx;
        }

        size_t size() const noexcept
        {
            return _size;
        }
    private:
        uint64_t _idx;
        size_t _size;
    };

    struct unknown_tag: error {
        explicit unknown_tag(const std::string_view tag):
            error { fmt::format("unknown type tag: '{}'", tag) }, _tag { tag }
        {
        }

        const std::string &tag() const noexcept
        {
            return _tag;
        }
    private:
        std::string _tag;
    };

    struct unsupported_hole: error {
        using error::error;
    };

    struct unhashable_map_key: error {
        using error::error;
    };

    struct resource_limit: error {
        using error::error;
    };
}

#endif // !DEVALUE_DEVALUE_ERROR_HPP
