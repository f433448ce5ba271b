/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <limits>
#include <dv/logger.hpp>
#include <dv/devalue/error.hpp>
#include <dv/devalue/hydrator.hpp>

namespace devalue {
    struct hydrator::depth_guard {
        explicit depth_guard(hydrator &h): _h { h }
        {
            if (_h._depth >= _h._opts.max_depth) [[unlikely]]
                throw resource_limit(fmt::format("the nesting depth of the input exceeds the limit of {}", _h._opts.max_depth));
            ++_h._depth;
        }

        ~depth_guard()
        {
            --_h._depth;
        }
    private:
        hydrator &_h;
    };

    hydrator::hydrator(const chunk_store &store, document &doc, const reviver_map &revivers, const decode_options &opts):
        _store { store }, _doc { doc }, _revivers { revivers }, _opts { opts },
        _hydrated(store.size()), _reviving(store.size(), false)
    {
    }

    value hydrator::decode()
    {
        if (const auto &bare = _store.standalone(); bare)
            return hydrate(*bare);
        logger::trace("hydrating {} chunks", _store.size());
        return hydrate(0);
    }

    value hydrator::hydrate(const int64_t index)
    {
        if (const auto s = sentinel_from_index(index); s && *s != sentinel::hole)
            return _sentinel(*s);
        if (_store.standalone())
            throw invalid_input(fmt::format("invalid input: a bare integer {} is not a sentinel", index));
        if (index == static_cast<int64_t>(sentinel::hole))
            throw unsupported_hole("a hole can be referenced only as an array element and holes are not supported");
        if (index < 0)
            throw invalid_input(fmt::format("invalid input: negative chunk index {}", index));
        const auto idx = static_cast<uint64_t>(index);
        if (idx < _hydrated.size() && _hydrated[idx])
            return *_hydrated[idx];
        const auto &chunk = _store.at(idx);
        depth_guard dg { *this };
        return _hydrate_chunk(idx, chunk);
    }

    value hydrator::_sentinel(const sentinel s)
    {
        switch (s) {
            case sentinel::undefined: return undefined;
            case sentinel::nan: return std::numeric_limits<double>::quiet_NaN();
            case sentinel::positive_infinity: return std::numeric_limits<double>::infinity();
            case sentinel::negative_infinity: return -std::numeric_limits<double>::infinity();
            case sentinel::negative_zero: return -0.0;
            case sentinel::hole: break;
        }
        throw error(fmt::format("sentinel {} has no value", static_cast<int64_t>(s)));
    }

    value hydrator::_literal(const json::value &jv)
    {
        switch (jv.kind()) {
            case json::kind::null: return nullptr;
            case json::kind::bool_: return jv.get_bool();
            case json::kind::int64: return jv.get_int64();
            // JavaScript numbers cannot hold such integers exactly either
            case json::kind::uint64: return static_cast<double>(jv.get_uint64());
            case json::kind::double_: return jv.get_double();
            case json::kind::string: return json::as_string_view(jv.get_string());
            default: throw error(fmt::format("a JSON container is not a literal: {}", json::serialize(jv)));
        }
    }

    value hydrator::_hydrate_ref(const json::value &jv)
    {
        switch (jv.kind()) {
            case json::kind::int64:
                return hydrate(jv.get_int64());
            case json::kind::uint64:
                throw index_out_of_range(jv.get_uint64(), _store.size());
            default:
                throw invalid_input(fmt::format("invalid input: expected a chunk index but got {}", json::serialize(jv)));
        }
    }

    const value &hydrator::_cache(const uint64_t idx, value v)
    {
        auto &slot = _hydrated.at(idx);
        slot.emplace(std::move(v));
        return *slot;
    }

    value hydrator::_hydrate_chunk(const uint64_t idx, const json::value &chunk)
    {
        switch (chunk.kind()) {
            case json::kind::array: {
                const auto &arr = chunk.get_array();
                if (!arr.empty() && arr[0].is_string())
                    return _hydrate_tagged(idx, arr);
                return _hydrate_array(idx, arr);
            }
            case json::kind::object:
                return _hydrate_object(idx, chunk.get_object());
            default:
                return _cache(idx, _literal(chunk));
        }
    }

    value hydrator::_hydrate_array(const uint64_t idx, const json::array &chunk)
    {
        const auto ref = _doc.new_array(chunk.size());
        _cache(idx, ref);
        for (size_t i = 0; i < chunk.size(); ++i) {
            const auto &item = chunk[i];
            if (item.is_int64() && item.get_int64() == static_cast<int64_t>(sentinel::hole))
                throw unsupported_hole(fmt::format("array chunk {} has a hole at position {} and holes are not supported", idx, i));
            auto v = _hydrate_ref(item);
            _doc.array(ref)[i] = std::move(v);
        }
        return ref;
    }

    value hydrator::_hydrate_object(const uint64_t idx, const json::object &chunk)
    {
        const auto ref = _doc.new_object();
        _cache(idx, ref);
        for (const auto &[key, item]: chunk) {
            auto v = _hydrate_ref(item);
            _doc.object(ref).set(std::string { key }, std::move(v));
        }
        return ref;
    }

    value hydrator::_hydrate_revived(const uint64_t idx, const reviver &rev, const json::array &chunk)
    {
        if (chunk.size() != 2)
            throw invalid_input(fmt::format("chunk {} with a custom tag '{}' must have exactly one payload element but has {}",
                idx, json::as_string_view(chunk[0].get_string()), chunk.size() - 1));
        // a reviver's result is not known until its payload is complete, so it cannot be referenced from within it
        if (_reviving.at(idx))
            throw invalid_input(fmt::format("chunk {} with a custom tag '{}' refers to itself through its payload",
                idx, json::as_string_view(chunk[0].get_string())));
        _reviving[idx] = true;
        auto payload = _hydrate_ref(chunk[1]);
        _reviving[idx] = false;
        return _cache(idx, rev(_doc, payload));
    }
}
