/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <array>
#include <dv/devalue/error.hpp>
#include <dv/devalue/hydrator.hpp>
#include <dv/devalue/tags.hpp>

namespace devalue {
    namespace {
        // Tag names are case-sensitive; "null" marks an object created with a null prototype
        static constexpr std::array<std::pair<std::string_view, builtin_tag>, 7> builtin_tags {{
            { "Date", builtin_tag::date },
            { "Set", builtin_tag::set },
            { "Map", builtin_tag::map },
            { "null", builtin_tag::null_object },
            { "RegExp", builtin_tag::regexp },
            { "Object", builtin_tag::object },
            { "BigInt", builtin_tag::bigint }
        }};

        void check_payload_size(const uint64_t idx, const builtin_tag tag, const json::array &chunk, const size_t min_sz, const size_t max_sz)
        {
            const auto payload_sz = chunk.size() - 1;
            if (payload_sz < min_sz || payload_sz > max_sz) [[unlikely]] {
                if (min_sz == max_sz)
                    throw invalid_input(fmt::format("chunk {} tagged '{}' must have {} payload elements but has {}",
                        idx, builtin_tag_name(tag), min_sz, payload_sz));
                throw invalid_input(fmt::format("chunk {} tagged '{}' must have from {} to {} payload elements but has {}",
                    idx, builtin_tag_name(tag), min_sz, max_sz, payload_sz));
            }
        }

        std::string_view payload_string(const uint64_t idx, const builtin_tag tag, const json::array &chunk, const size_t pos)
        {
            const auto &jv = chunk.at(pos);
            if (!jv.is_string()) [[unlikely]]
                throw invalid_input(fmt::format("chunk {} tagged '{}' must have a string at position {} but got {}",
                    idx, builtin_tag_name(tag), pos, json::serialize(jv)));
            return json::as_string_view(jv.get_string());
        }

        // The serializer writes boxed primitives inline rather than as chunk references
        value boxed_primitive(const uint64_t idx, const json::value &jv)
        {
            switch (jv.kind()) {
                case json::kind::bool_: return jv.get_bool();
                case json::kind::int64: return jv.get_int64();
                case json::kind::uint64: return static_cast<double>(jv.get_uint64());
                case json::kind::double_: return jv.get_double();
                case json::kind::string: return json::as_string_view(jv.get_string());
                default:
                    throw invalid_input(fmt::format("chunk {} tagged 'Object' must box a primitive but got {}", idx, json::serialize(jv)));
            }
        }
    }

    std::optional<builtin_tag> builtin_tag_from_name(const std::string_view name) noexcept
    {
        for (const auto &[tag_name, tag]: builtin_tags) {
            if (tag_name == name)
                return tag;
        }
        return {};
    }

    std::string_view builtin_tag_name(const builtin_tag tag) noexcept
    {
        for (const auto &[tag_name, t]: builtin_tags) {
            if (t == tag)
                return tag_name;
        }
        return "unknown";
    }

    value hydrator::_hydrate_tagged(const uint64_t idx, const json::array &chunk)
    {
        const auto name = json::as_string_view(chunk.at(0).get_string());
        if (const auto rev_it = _revivers.find(name); rev_it != _revivers.end())
            return _hydrate_revived(idx, rev_it->second, chunk);
        const auto tag = builtin_tag_from_name(name);
        if (!tag) [[unlikely]]
            throw unknown_tag(name);
        return _hydrate_builtin(idx, *tag, chunk);
    }

    value hydrator::_hydrate_builtin(const uint64_t idx, const builtin_tag tag, const json::array &chunk)
    {
        switch (tag) {
            case builtin_tag::set:
                return _hydrate_set(idx, chunk);
            case builtin_tag::map:
                return _hydrate_map(idx, chunk);
            case builtin_tag::null_object:
                return _hydrate_null_object(idx, chunk);
            case builtin_tag::date:
                check_payload_size(idx, tag, chunk, 1, 1);
                return _cache(idx, date_from_iso(payload_string(idx, tag, chunk, 1)));
            case builtin_tag::regexp: {
                check_payload_size(idx, tag, chunk, 1, 2);
                const auto source = payload_string(idx, tag, chunk, 1);
                // the global flag has no equivalent for a compiled pattern and is ignored
                const auto flags = chunk.size() > 2 ? payload_string(idx, tag, chunk, 2) : std::string_view {};
                return _cache(idx, regexp::compile(source, flags));
            }
            case builtin_tag::object:
                check_payload_size(idx, tag, chunk, 1, 1);
                return _cache(idx, boxed_primitive(idx, chunk[1]));
            case builtin_tag::bigint: {
                check_payload_size(idx, tag, chunk, 1, 1);
                const auto digits = payload_string(idx, tag, chunk, 1);
                try {
                    return _cache(idx, big_int_from_decimal(digits));
                } catch (const error &ex) {
                    throw invalid_input(fmt::format("chunk {} tagged 'BigInt' has an invalid payload", idx), ex);
                }
            }
        }
        throw error(fmt::format("unsupported builtin tag: {}", static_cast<int>(tag)));
    }

    value hydrator::_hydrate_set(const uint64_t idx, const json::array &chunk)
    {
        const auto ref = _doc.new_set();
        _cache(idx, ref);
        for (size_t i = 1; i < chunk.size(); ++i) {
            auto item = _hydrate_ref(chunk[i]);
            _doc.set(ref).add(std::move(item));
        }
        return ref;
    }

    value hydrator::_hydrate_map(const uint64_t idx, const json::array &chunk)
    {
        if (chunk.size() % 2 != 1) [[unlikely]]
            throw invalid_input(fmt::format("chunk {} tagged 'Map' must have an even number of payload elements but has {}", idx, chunk.size() - 1));
        const auto ref = _doc.new_map();
        _cache(idx, ref);
        for (size_t i = 1; i < chunk.size(); i += 2) {
            auto key = _hydrate_ref(chunk[i]);
            if (!key.hashable()) [[unlikely]]
                throw unhashable_map_key(fmt::format("invalid key for Map: {}", key.type_name()));
            auto val = _hydrate_ref(chunk[i + 1]);
            _doc.map(ref).set(key, std::move(val));
        }
        return ref;
    }

    value hydrator::_hydrate_null_object(const uint64_t idx, const json::array &chunk)
    {
        if (chunk.size() % 2 != 1) [[unlikely]]
            throw invalid_input(fmt::format("chunk {} tagged 'null' must have an even number of payload elements but has {}", idx, chunk.size() - 1));
        const auto ref = _doc.new_object();
        _cache(idx, ref);
        for (size_t i = 1; i < chunk.size(); i += 2) {
            // keys are written inline as property names
            const auto &key = chunk[i];
            if (!key.is_string()) [[unlikely]]
                throw unhashable_map_key(fmt::format("invalid key for a null-prototype object: {}", json::serialize(key)));
            auto val = _hydrate_ref(chunk[i + 1]);
            _doc.object(ref).set(std::string { json::as_string_view(key.get_string()) }, std::move(val));
        }
        return ref;
    }
}
