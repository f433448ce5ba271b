/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <dv/devalue/chunk-store.hpp>
#include <dv/devalue/error.hpp>

namespace devalue {
    static std::string_view kind_name(const json::kind k)
    {
        switch (k) {
            case json::kind::null: return "null";
            case json::kind::bool_: return "boolean";
            case json::kind::int64:
            case json::kind::uint64: return "integer";
            case json::kind::double_: return "number";
            case json::kind::string: return "string";
            case json::kind::array: return "array";
            case json::kind::object: return "object";
        }
        return "unknown";
    }

    chunk_store::chunk_store(const json::value &payload, const decode_options &opts)
    {
        switch (payload.kind()) {
            case json::kind::int64:
                _standalone = payload.get_int64();
                break;
            case json::kind::uint64:
                throw invalid_input(fmt::format("invalid input: a bare integer {} is not a sentinel", payload.get_uint64()));
            case json::kind::array: {
                const auto &chunks = payload.get_array();
                if (chunks.empty())
                    throw invalid_input("invalid input: the chunk array must not be empty");
                if (chunks.size() > opts.max_chunks)
                    throw resource_limit(fmt::format("the input has {} chunks but at most {} are allowed", chunks.size(), opts.max_chunks));
                _chunks = &chunks;
                break;
            }
            default:
                throw invalid_input(fmt::format("invalid input: expected an array of chunks or an integer but got {}", kind_name(payload.kind())));
        }
    }

    const json::value &chunk_store::at(const uint64_t idx) const
    {
        if (idx >= size()) [[unlikely]]
            throw index_out_of_range(idx, size());
        return (*_chunks)[idx];
    }
}
