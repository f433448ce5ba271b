/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_CLI_COMMON_HPP
#define DEVALUE_CLI_COMMON_HPP

#include <dv/cli.hpp>
#include <dv/devalue.hpp>

namespace devalue::cli::common {
    extern void add_opts(config &cmd);
    // explicit --max-depth and --max-chunks take precedence over the --config file
    extern decode_options decode_opts(const options &opts);
    extern void print(std::ostream &os, const document &doc, const options &opts);
}

#endif // !DEVALUE_CLI_COMMON_HPP
