/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cmath>
#include <limits>
#include <boost/container_hash/hash.hpp>
#include <dv/devalue/value.hpp>

namespace devalue {
    namespace {
        bool same_value_zero(const double x, const double y)
        {
            if (std::isnan(x) && std::isnan(y))
                return true;
            return x == y;
        }

        // Exact: a double equals an int64 only if it holds the same integral value
        bool same_value_zero(const int64_t i, const double d)
        {
            if (std::trunc(d) != d || d < -9223372036854775808.0 || d >= 9223372036854775808.0)
                return false;
            return static_cast<int64_t>(d) == i;
        }

        // Integral doubles must hash like the equal int64 values
        size_t hash_number(const double d)
        {
            if (std::isnan(d))
                return boost::hash_value(std::numeric_limits<double>::quiet_NaN());
            if (d == 0.0)
                return boost::hash_value(int64_t { 0 });
            if (std::trunc(d) == d && d >= -9223372036854775808.0 && d < 9223372036854775808.0)
                return boost::hash_value(static_cast<int64_t>(d));
            return boost::hash_value(d);
        }
    }

    double value::as_number() const
    {
        switch (type()) {
            case value_type::integer: return static_cast<double>(std::get<int64_t>(_storage));
            case value_type::number: return std::get<double>(_storage);
            default: throw error(fmt::format("expected a number but got {}", type_name()));
        }
    }

    bool value::operator==(const value &o) const
    {
        if (is_number() && o.is_number()) {
            if (is<int64_t>() && o.is<int64_t>())
                return std::get<int64_t>(_storage) == std::get<int64_t>(o._storage);
            if (is<int64_t>())
                return same_value_zero(std::get<int64_t>(_storage), std::get<double>(o._storage));
            if (o.is<int64_t>())
                return same_value_zero(std::get<int64_t>(o._storage), std::get<double>(_storage));
            return same_value_zero(std::get<double>(_storage), std::get<double>(o._storage));
        }
        if (type() != o.type())
            return false;
        return std::visit([&](const auto &x) {
            using T = std::decay_t<decltype(x)>;
            return x == std::get<T>(o._storage);
        }, _storage);
    }

    std::string_view value::type_name() const noexcept
    {
        switch (type()) {
            case value_type::null: return "null";
            case value_type::undefined: return "undefined";
            case value_type::boolean: return "boolean";
            case value_type::integer: return "integer";
            case value_type::number: return "number";
            case value_type::string: return "string";
            case value_type::date: return "date";
            case value_type::regexp: return "regexp";
            case value_type::bigint: return "bigint";
            case value_type::custom: return "custom";
            case value_type::array: return "array";
            case value_type::object: return "object";
            case value_type::set: return "set";
            case value_type::map: return "map";
        }
        return "unknown";
    }

    size_t value_hash::operator()(const value &v) const
    {
        size_t seed = 0;
        // numbers share a kind so that equal integers and doubles collide
        boost::hash_combine(seed, v.is_number() ? static_cast<uint8_t>(value_type::number) : static_cast<uint8_t>(v.type()));
        switch (v.type()) {
            case value_type::null:
            case value_type::undefined:
                break;
            case value_type::boolean:
                boost::hash_combine(seed, v.as<bool>());
                break;
            case value_type::integer:
                boost::hash_combine(seed, boost::hash_value(v.as<int64_t>()));
                break;
            case value_type::number:
                boost::hash_combine(seed, hash_number(v.as<double>()));
                break;
            case value_type::string:
                boost::hash_combine(seed, v.as<std::string>());
                break;
            case value_type::date:
                boost::hash_combine(seed, date_to_iso(v.as<date>()));
                break;
            case value_type::regexp:
                boost::hash_combine(seed, v.as<regexp>().source());
                boost::hash_combine(seed, v.as<regexp>().flags());
                break;
            case value_type::bigint:
                boost::hash_combine(seed, v.as<cpp_int>().str());
                break;
            case value_type::custom:
                boost::hash_combine(seed, v.as<custom>().data.get());
                break;
            case value_type::array:
                boost::hash_combine(seed, v.as<array_ref>().id);
                break;
            case value_type::object:
                boost::hash_combine(seed, v.as<object_ref>().id);
                break;
            case value_type::set:
                boost::hash_combine(seed, v.as<set_ref>().id);
                break;
            case value_type::map:
                boost::hash_combine(seed, v.as<map_ref>().id);
                break;
        }
        return seed;
    }

    node_id document::_next_id() const
    {
        if (_nodes.size() >= std::numeric_limits<node_id>::max()) [[unlikely]]
            throw error(fmt::format("a document cannot have more than {} nodes", std::numeric_limits<node_id>::max()));
        return static_cast<node_id>(_nodes.size());
    }

    array_ref document::new_array(const size_t size)
    {
        const auto id = _next_id();
        _nodes.emplace_back(std::in_place_type<array_node>, size);
        return { id };
    }

    object_ref document::new_object()
    {
        const auto id = _next_id();
        _nodes.emplace_back(std::in_place_type<object_node>);
        return { id };
    }

    set_ref document::new_set()
    {
        const auto id = _next_id();
        _nodes.emplace_back(std::in_place_type<set_node>);
        return { id };
    }

    map_ref document::new_map()
    {
        const auto id = _next_id();
        _nodes.emplace_back(std::in_place_type<map_node>);
        return { id };
    }
}
