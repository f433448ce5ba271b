/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_OPTIONS_HPP
#define DEVALUE_DEVALUE_OPTIONS_HPP

#include <cstddef>
#include <dv/config.hpp>

namespace devalue {
    struct decode_options {
        static constexpr size_t default_max_depth = 1024;
        static constexpr size_t default_max_chunks = 1 << 20;

        // Reads the optional maxDepth and maxChunks keys, other keys are ignored
        static decode_options from_config(const config &cfg);

        size_t max_depth = default_max_depth;
        size_t max_chunks = default_max_chunks;
    };
}

#endif // !DEVALUE_DEVALUE_OPTIONS_HPP
