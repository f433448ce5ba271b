/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cmath>
#include <iterator>
#include <set>
#include <dv/devalue/error.hpp>
#include <dv/devalue/inspect.hpp>

namespace devalue {
    namespace {
        std::string format_number(const double d)
        {
            if (std::isnan(d))
                return "NaN";
            if (std::isinf(d))
                return d > 0 ? "Infinity" : "-Infinity";
            if (d == 0.0 && std::signbit(d))
                return "-0";
            return fmt::format("{}", d);
        }

        // tracks the containers currently on the printing stack and the work done so far
        struct container_stack {
            explicit container_stack(const render_limits &limits): _limits { limits }
            {
            }

            bool enter(const node_id id)
            {
                return _ids.emplace(id).second;
            }

            void leave(const node_id id)
            {
                _ids.erase(id);
            }

            bool too_deep() const noexcept
            {
                return _ids.size() >= _limits.max_depth;
            }

            size_t max_depth() const noexcept
            {
                return _limits.max_depth;
            }

            void count_item()
            {
                if (++_items > _limits.max_items) [[unlikely]]
                    throw resource_limit(fmt::format("the value expands to more than {} items", _limits.max_items));
            }
        private:
            const render_limits &_limits;
            std::set<node_id> _ids {};
            size_t _items = 0;
        };

        struct inspector {
            explicit inspector(const document &doc, const render_limits &limits): _doc { doc }, _stack { limits }
            {
            }

            void print(const value &v)
            {
                _stack.count_item();
                std::visit([&](const auto &x) { _print(x); }, v.storage());
            }

            std::string &&result()
            {
                return std::move(_out);
            }
        private:
            const document &_doc;
            std::string _out {};
            container_stack _stack;

            void _print(std::nullptr_t) { _out += "null"; }
            void _print(const undefined_t &) { _out += "undefined"; }
            void _print(const bool b) { _out += b ? "true" : "false"; }
            void _print(const int64_t i) { fmt::format_to(std::back_inserter(_out), "{}", i); }
            void _print(const double d) { _out += format_number(d); }
            void _print(const std::string &s) { _out += json::serialize(json::string_view { s }); }
            void _print(const date &d) { fmt::format_to(std::back_inserter(_out), "Date({})", date_to_iso(d)); }
            void _print(const regexp &re) { fmt::format_to(std::back_inserter(_out), "/{}/{}", re.source(), re.flags()); }
            void _print(const cpp_int &i) { fmt::format_to(std::back_inserter(_out), "{}n", i); }
            void _print(const custom &c) { fmt::format_to(std::back_inserter(_out), "[{}]", c.tag); }

            template<typename F>
            void _container(const node_id id, const std::string_view name, const F &body)
            {
                if (_stack.too_deep()) {
                    fmt::format_to(std::back_inserter(_out), "[{}]", name);
                    return;
                }
                if (!_stack.enter(id)) {
                    fmt::format_to(std::back_inserter(_out), "[Circular *{}]", id);
                    return;
                }
                body();
                _stack.leave(id);
            }

            template<typename R>
            void _items(const R &range, const char open, const char close)
            {
                _out += open;
                for (auto it = range.begin(); it != range.end(); ++it) {
                    if (it != range.begin())
                        _out += ", ";
                    print(*it);
                }
                _out += close;
            }

            void _print(const array_ref r)
            {
                _container(r.id, "Array", [&] { _items(_doc.array(r), '[', ']'); });
            }

            void _print(const set_ref r)
            {
                _container(r.id, "Set", [&] {
                    const auto &s = _doc.set(r);
                    fmt::format_to(std::back_inserter(_out), "Set({}) ", s.size());
                    _items(s, '{', '}');
                });
            }

            void _print(const object_ref r)
            {
                _container(r.id, "Object", [&] {
                    const auto &obj = _doc.object(r);
                    _out += '{';
                    for (auto it = obj.begin(); it != obj.end(); ++it) {
                        if (it != obj.begin())
                            _out += ", ";
                        _print(it->first);
                        _out += ": ";
                        print(it->second);
                    }
                    _out += '}';
                });
            }

            void _print(const map_ref r)
            {
                _container(r.id, "Map", [&] {
                    const auto &m = _doc.map(r);
                    fmt::format_to(std::back_inserter(_out), "Map({}) {{", m.size());
                    for (auto it = m.begin(); it != m.end(); ++it) {
                        if (it != m.begin())
                            _out += ", ";
                        print(it->first);
                        _out += " => ";
                        print(it->second);
                    }
                    _out += '}';
                });
            }
        };

        struct json_exporter {
            explicit json_exporter(const document &doc, const render_limits &limits): _doc { doc }, _stack { limits }
            {
            }

            json::value convert(const value &v)
            {
                _stack.count_item();
                return std::visit([&](const auto &x) { return _convert(x); }, v.storage());
            }
        private:
            const document &_doc;
            container_stack _stack;

            json::value _convert(std::nullptr_t) { return nullptr; }
            json::value _convert(const undefined_t &) { return nullptr; }
            json::value _convert(const bool b) { return b; }
            json::value _convert(const int64_t i) { return i; }

            json::value _convert(const double d)
            {
                if (!std::isfinite(d))
                    return nullptr;
                // JSON.stringify writes 0 for the negative zero
                if (d == 0.0)
                    return int64_t { 0 };
                return d;
            }

            json::value _convert(const std::string &s) { return json::string(s); }
            json::value _convert(const date &d) { return json::string(date_to_iso(d)); }
            json::value _convert(const regexp &re) { return json::string(re.source()); }
            json::value _convert(const cpp_int &i) { return json::string(i.str()); }

            json::value _convert(const custom &c)
            {
                throw error(fmt::format("a custom value '{}' has no JSON representation", c.tag));
            }

            template<typename F>
            json::value _container(const node_id id, const F &body)
            {
                if (_stack.too_deep()) [[unlikely]]
                    throw resource_limit(fmt::format("cannot convert a value nested deeper than {} levels to JSON", _stack.max_depth()));
                if (!_stack.enter(id))
                    throw error(fmt::format("cannot convert a cyclic value to JSON: node {} refers to itself", id));
                auto res = body();
                _stack.leave(id);
                return res;
            }

            template<typename R>
            json::value _items(const R &range)
            {
                json::array arr {};
                for (const auto &item: range)
                    arr.emplace_back(convert(item));
                return arr;
            }

            json::value _convert(const array_ref r)
            {
                return _container(r.id, [&] { return _items(_doc.array(r)); });
            }

            json::value _convert(const set_ref r)
            {
                return _container(r.id, [&] { return _items(_doc.set(r)); });
            }

            json::value _convert(const object_ref r)
            {
                return _container(r.id, [&] {
                    json::object obj {};
                    for (const auto &[k, v]: _doc.object(r))
                        obj.insert_or_assign(k, convert(v));
                    return json::value(std::move(obj));
                });
            }

            json::value _convert(const map_ref r)
            {
                return _container(r.id, [&] {
                    json::array arr {};
                    for (const auto &[k, v]: _doc.map(r)) {
                        json::array entry {};
                        entry.emplace_back(convert(k));
                        entry.emplace_back(convert(v));
                        arr.emplace_back(std::move(entry));
                    }
                    return json::value(std::move(arr));
                });
            }
        };
    }

    std::string inspect(const document &doc, const value &v, const render_limits &limits)
    {
        inspector insp { doc, limits };
        insp.print(v);
        return insp.result();
    }

    json::value to_json(const document &doc, const value &v, const render_limits &limits)
    {
        json_exporter exp { doc, limits };
        return exp.convert(v);
    }
}
