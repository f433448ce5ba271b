/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_HPP
#define DEVALUE_DEVALUE_HPP

#include <string_view>
#include <dv/json.hpp>
#include <dv/devalue/error.hpp>
#include <dv/devalue/inspect.hpp>
#include <dv/devalue/options.hpp>
#include <dv/devalue/reviver.hpp>
#include <dv/devalue/value.hpp>

namespace devalue {
    // Decodes a string produced by devalue's stringify.
    // Throws invalid_input, index_out_of_range, unknown_tag, unsupported_hole, unhashable_map_key, or resource_limit.
    extern document parse(std::string_view serialized, const reviver_map &revivers={}, const decode_options &opts={});

    // Same as parse but for an already parsed JSON payload
    extern document unflatten(const json::value &payload, const reviver_map &revivers={}, const decode_options &opts={});
}

#endif // !DEVALUE_DEVALUE_HPP
