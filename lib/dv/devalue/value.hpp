/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */
#ifndef DEVALUE_DEVALUE_VALUE_HPP
#define DEVALUE_DEVALUE_VALUE_HPP

#include <any>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include <dv/big-int.hpp>
#include <dv/devalue/date.hpp>
#include <dv/devalue/regexp.hpp>

namespace devalue {
    struct undefined_t {
        bool operator==(const undefined_t &) const noexcept
        {
            return true;
        }
    };
    static constexpr undefined_t undefined {};

    using node_id = uint32_t;

    template<typename TAG>
    struct node_ref {
        node_id id = 0;

        bool operator==(const node_ref &o) const noexcept
        {
            return id == o.id;
        }
    };

    struct array_tag {};
    struct object_tag {};
    struct set_tag {};
    struct map_tag {};

    using array_ref = node_ref<array_tag>;
    using object_ref = node_ref<object_tag>;
    using set_ref = node_ref<set_tag>;
    using map_ref = node_ref<map_tag>;

    // A value produced by a reviver that has no counterpart among the built-in alternatives
    struct custom {
        std::string tag {};
        std::shared_ptr<const std::any> data {};

        template<typename T>
        const T &as() const
        {
            if (!data)
                throw error(fmt::format("custom value '{}' is empty", tag));
            if (const auto *ptr = std::any_cast<T>(data.get()); ptr)
                return *ptr;
            throw error(fmt::format("custom value '{}' holds {} but {} was requested", tag, data->type().name(), typeid(T).name()));
        }

        bool operator==(const custom &o) const noexcept
        {
            return tag == o.tag && data == o.data;
        }
    };

    template<typename T>
    custom make_custom(std::string tag, T &&val)
    {
        return { std::move(tag), std::make_shared<const std::any>(std::forward<T>(val)) };
    }

    enum class value_type: uint8_t {
        null      = 0,
        undefined = 1,
        boolean   = 2,
        integer   = 3,
        number    = 4,
        string    = 5,
        date      = 6,
        regexp    = 7,
        bigint    = 8,
        custom    = 9,
        array     = 10,
        object    = 11,
        set       = 12,
        map       = 13
    };

    struct value {
        using storage_type = std::variant<std::nullptr_t, undefined_t, bool, int64_t, double, std::string,
            date, regexp, cpp_int, custom, array_ref, object_ref, set_ref, map_ref>;

        value(): _storage { nullptr } {}
        value(std::nullptr_t): _storage { nullptr } {}
        value(undefined_t): _storage { undefined } {}
        value(const bool b): _storage { b } {}
        value(const int i): _storage { int64_t { i } } {}
        value(const int64_t i): _storage { i } {}
        value(const double d): _storage { d } {}
        value(const char *s): _storage { std::string { s } } {}
        value(const std::string_view s): _storage { std::string { s } } {}
        value(std::string &&s): _storage { std::move(s) } {}
        value(const std::string &s): _storage { s } {}
        value(const date &d): _storage { d } {}
        value(regexp &&re): _storage { std::move(re) } {}
        value(cpp_int &&i): _storage { std::move(i) } {}
        value(const cpp_int &i): _storage { i } {}
        value(custom &&c): _storage { std::move(c) } {}
        value(const array_ref r): _storage { r } {}
        value(const object_ref r): _storage { r } {}
        value(const set_ref r): _storage { r } {}
        value(const map_ref r): _storage { r } {}

        value_type type() const noexcept
        {
            return static_cast<value_type>(_storage.index());
        }

        const storage_type &storage() const noexcept
        {
            return _storage;
        }

        template<typename T>
        bool is() const noexcept
        {
            return std::holds_alternative<T>(_storage);
        }

        template<typename T>
        const T &as() const
        {
            if (const auto *ptr = std::get_if<T>(&_storage); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("expected a value of type {} but got {}", typeid(T).name(), type_name()));
        }

        bool is_null() const noexcept { return is<std::nullptr_t>(); }
        bool is_undefined() const noexcept { return is<undefined_t>(); }
        bool is_container() const noexcept { return type() >= value_type::array; }
        bool is_number() const noexcept { return is<int64_t>() || is<double>(); }

        // JavaScript numbers are doubles, so integers are promoted
        double as_number() const;
        const std::string &as_string() const { return as<std::string>(); }

        // Only scalars are allowed to serve as map keys
        bool hashable() const noexcept
        {
            return !is_container() && !is<custom>();
        }

        // SameValueZero: NaN equals itself, zeros of both signs are equal, containers compare by identity
        bool operator==(const value &o) const;

        std::string_view type_name() const noexcept;
    private:
        storage_type _storage;
    };

    struct value_hash {
        size_t operator()(const value &v) const;
    };

    struct array_node: std::vector<value> {
        using std::vector<value>::vector;
    };

    // Keeps keys in their insertion order; a repeated key replaces the value in place
    template<typename K, typename H=std::hash<K>>
    struct ordered_map {
        using entry_type = std::pair<K, value>;
        using storage_type = std::vector<entry_type>;
        using const_iterator = typename storage_type::const_iterator;

        void set(const K &k, value v)
        {
            if (const auto [it, created] = _index.try_emplace(k, _entries.size()); !created)
                _entries[it->second].second = std::move(v);
            else
                _entries.emplace_back(k, std::move(v));
        }

        const value *find(const K &k) const
        {
            if (const auto it = _index.find(k); it != _index.end())
                return &_entries[it->second].second;
            return nullptr;
        }

        const value &at(const K &k) const
        {
            if (const auto *v = find(k); v) [[likely]]
                return *v;
            throw error("the requested key is missing");
        }

        bool contains(const K &k) const
        {
            return _index.contains(k);
        }

        size_t size() const noexcept
        {
            return _entries.size();
        }

        bool empty() const noexcept
        {
            return _entries.empty();
        }

        const_iterator begin() const noexcept
        {
            return _entries.begin();
        }

        const_iterator end() const noexcept
        {
            return _entries.end();
        }
    private:
        storage_type _entries {};
        std::unordered_map<K, size_t, H> _index {};
    };

    struct object_node: ordered_map<std::string> {
    };

    struct map_node: ordered_map<value, value_hash> {
    };

    struct set_node {
        using const_iterator = std::vector<value>::const_iterator;

        // returns false if the value has already been present
        bool add(value v)
        {
            if (const auto [it, created] = _index.try_emplace(v, _items.size()); !created)
                return false;
            _items.emplace_back(std::move(v));
            return true;
        }

        bool contains(const value &v) const
        {
            return _index.contains(v);
        }

        size_t size() const noexcept
        {
            return _items.size();
        }

        bool empty() const noexcept
        {
            return _items.empty();
        }

        const_iterator begin() const noexcept
        {
            return _items.begin();
        }

        const_iterator end() const noexcept
        {
            return _items.end();
        }
    private:
        std::vector<value> _items {};
        std::unordered_map<value, size_t, value_hash> _index {};
    };

    // Owns all containers produced by a decode call. Containers refer to each other by node ids,
    // which makes shared and cyclic references plain data.
    struct document {
        using node = std::variant<array_node, object_node, set_node, map_node>;

        document() =default;
        document(document &&) =default;
        document &operator=(document &&) =default;
        document(const document &) =delete;
        document &operator=(const document &) =delete;

        const value &root() const noexcept
        {
            return _root;
        }

        void root(value v)
        {
            _root = std::move(v);
        }

        size_t num_nodes() const noexcept
        {
            return _nodes.size();
        }

        array_ref new_array(size_t size=0);
        object_ref new_object();
        set_ref new_set();
        map_ref new_map();

        // Node references stay valid when new nodes are added
        array_node &array(const array_ref r) { return _node<array_node>(r.id); }
        const array_node &array(const array_ref r) const { return _node<array_node>(r.id); }
        object_node &object(const object_ref r) { return _node<object_node>(r.id); }
        const object_node &object(const object_ref r) const { return _node<object_node>(r.id); }
        set_node &set(const set_ref r) { return _node<set_node>(r.id); }
        const set_node &set(const set_ref r) const { return _node<set_node>(r.id); }
        map_node &map(const map_ref r) { return _node<map_node>(r.id); }
        const map_node &map(const map_ref r) const { return _node<map_node>(r.id); }

        const array_node &array(const value &v) const { return array(v.as<array_ref>()); }
        const object_node &object(const value &v) const { return object(v.as<object_ref>()); }
        const set_node &set(const value &v) const { return set(v.as<set_ref>()); }
        const map_node &map(const value &v) const { return map(v.as<map_ref>()); }
    private:
        std::deque<node> _nodes {};
        value _root {};

        node_id _next_id() const;

        template<typename T>
        T &_node(const node_id id)
        {
            return const_cast<T &>(static_cast<const document &>(*this)._node<T>(id));
        }

        template<typename T>
        const T &_node(const node_id id) const
        {
            if (id >= _nodes.size()) [[unlikely]]
                throw error(fmt::format("node id {} is out of range: the document has {} nodes", id, _nodes.size()));
            if (const auto *ptr = std::get_if<T>(&_nodes[id]); ptr) [[likely]]
                return *ptr;
            throw error(fmt::format("node {} holds a different container type than {}", id, typeid(T).name()));
        }
    };
}

#endif // !DEVALUE_DEVALUE_VALUE_HPP
