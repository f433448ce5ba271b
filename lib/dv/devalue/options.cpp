/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/devalue/options.hpp>

namespace devalue {
    static size_t positive_limit(const config &cfg, const std::string_view name, const size_t def)
    {
        const auto *jv = cfg.find(name);
        if (!jv)
            return def;
        if (jv->is_uint64() && jv->get_uint64() > 0)
            return static_cast<size_t>(jv->get_uint64());
        if (jv->is_int64() && jv->get_int64() > 0)
            return static_cast<size_t>(jv->get_int64());
        throw error(fmt::format("configuration element {} must be a positive integer but got: {}", name, json::serialize(*jv)));
    }

    decode_options decode_options::from_config(const config &cfg)
    {
        decode_options opts {};
        opts.max_depth = positive_limit(cfg, "maxDepth", default_max_depth);
        opts.max_chunks = positive_limit(cfg, "maxChunks", default_max_chunks);
        return opts;
    }
}
