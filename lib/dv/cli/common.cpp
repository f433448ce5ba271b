/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <charconv>
#include <dv/cli/common.hpp>

namespace devalue::cli::common {
    static std::optional<size_t> parse_limit(const std::optional<std::string> &val)
    {
        if (!val)
            return {};
        size_t res = 0;
        const auto *end = val->data() + val->size();
        if (const auto [ptr, ec] = std::from_chars(val->data(), end, res); ec != std::errc {} || ptr != end || res == 0)
            return {};
        return res;
    }

    static std::optional<std::string> validate_limit(const std::optional<std::string> &val)
    {
        if (!parse_limit(val))
            return "must be a positive integer";
        return {};
    }

    void add_opts(config &cmd)
    {
        cmd.opts.try_emplace("json", "print the decoded value as plain JSON");
        cmd.opts.try_emplace("config", "a JSON file with maxDepth and maxChunks decoding limits");
        cmd.opts.try_emplace("max-depth", option_config { "the maximum nesting depth of the input", {}, validate_limit });
        cmd.opts.try_emplace("max-chunks", option_config { "the maximum number of chunks in the input", {}, validate_limit });
    }

    decode_options decode_opts(const options &opts)
    {
        decode_options res {};
        if (const auto it = opts.find("config"); it != opts.end()) {
            if (!it->second)
                throw error("--config requires a path to a configuration file");
            res = decode_options::from_config(config_file { *it->second });
        }
        if (const auto it = opts.find("max-depth"); it != opts.end())
            res.max_depth = *parse_limit(it->second);
        if (const auto it = opts.find("max-chunks"); it != opts.end())
            res.max_chunks = *parse_limit(it->second);
        logger::debug("decoding limits: max-depth: {} max-chunks: {}", res.max_depth, res.max_chunks);
        return res;
    }

    void print(std::ostream &os, const document &doc, const options &opts)
    {
        if (opts.contains("json")) {
            json::save_pretty(os, to_json(doc));
            os << '\n';
        } else {
            os << inspect(doc) << '\n';
        }
    }
}
