/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <dv/cli/common.hpp>

namespace devalue::cli::parse {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parse";
            cmd.desc = "decode a devalue-serialized string and print the result";
            cmd.args.expect({ "<serialized>" });
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto doc = devalue::parse(args.at(0), {}, common::decode_opts(opts));
            common::print(std::cout, doc, opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
