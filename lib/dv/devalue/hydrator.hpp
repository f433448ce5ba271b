/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_HYDRATOR_HPP
#define DEVALUE_DEVALUE_HYDRATOR_HPP

#include <optional>
#include <vector>
#include <dv/devalue/chunk-store.hpp>
#include <dv/devalue/constants.hpp>
#include <dv/devalue/options.hpp>
#include <dv/devalue/reviver.hpp>
#include <dv/devalue/tags.hpp>
#include <dv/devalue/value.hpp>

namespace devalue {
    // Resolves chunk indices into values. Every chunk is hydrated at most once; containers are
    // registered in the cache before their children, so children can refer back to them.
    // Not thread-safe, a new instance is expected per decode call.
    struct hydrator {
        hydrator(const chunk_store &store, document &doc, const reviver_map &revivers, const decode_options &opts={});

        value hydrate(int64_t index);
        // the root value: a sentinel for a standalone payload, chunk 0 otherwise
        value decode();
    private:
        struct depth_guard;

        const chunk_store &_store;
        document &_doc;
        const reviver_map &_revivers;
        const decode_options &_opts;
        std::vector<std::optional<value>> _hydrated;
        std::vector<bool> _reviving;
        size_t _depth = 0;

        static value _sentinel(sentinel s);
        static value _literal(const json::value &jv);
        value _hydrate_ref(const json::value &jv);
        value _hydrate_chunk(uint64_t idx, const json::value &chunk);
        value _hydrate_array(uint64_t idx, const json::array &chunk);
        value _hydrate_object(uint64_t idx, const json::object &chunk);
        value _hydrate_revived(uint64_t idx, const reviver &rev, const json::array &chunk);
        const value &_cache(uint64_t idx, value v);

        // tag dispatch, see tags.cpp
        value _hydrate_tagged(uint64_t idx, const json::array &chunk);
        value _hydrate_builtin(uint64_t idx, builtin_tag tag, const json::array &chunk);
        value _hydrate_set(uint64_t idx, const json::array &chunk);
        value _hydrate_map(uint64_t idx, const json::array &chunk);
        value _hydrate_null_object(uint64_t idx, const json::array &chunk);
    };
}

#endif // !DEVALUE_DEVALUE_HYDRATOR_HPP
