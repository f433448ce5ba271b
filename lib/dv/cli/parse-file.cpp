/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#include <dv/file.hpp>
#include <dv/cli/common.hpp>

namespace devalue::cli::parse_file {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "parse-file";
            cmd.desc = "decode the devalue-serialized contents of <path> and print the result";
            cmd.args.expect({ "<path>" });
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto serialized = file::read(path);
            logger::debug("read {} bytes from {}", serialized.size(), path);
            const auto doc = devalue::parse(serialized, {}, common::decode_opts(opts));
            common::print(std::cout, doc, opts);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
