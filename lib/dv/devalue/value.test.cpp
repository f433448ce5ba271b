/* This file is part of Devalue Turbo project.
 * Copyright (c) 2026 Devalue Turbo contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <cmath>
#include <limits>
#include <dv/common/test.hpp>
#include <dv/devalue/value.hpp>

using namespace devalue;

suite devalue_value_suite = [] {
    "devalue::value"_test = [] {
        "type tags"_test = [] {
            expect(value {}.is_null());
            expect(value { undefined }.is_undefined());
            expect(value { true }.type() == value_type::boolean);
            expect(value { 1 }.type() == value_type::integer);
            expect(value { 1.5 }.type() == value_type::number);
            expect(value { "abc" }.type() == value_type::string);
            expect(value { cpp_int { 7 } }.type() == value_type::bigint);
            expect(value { array_ref { 0 } }.is_container());
            expect(!value { "abc" }.is_container());
            test_same(std::string { "map" }, std::string { value { map_ref { 3 } }.type_name() });
        };
        "as reports type mismatches"_test = [] {
            expect(throws<error>([] { value { 1 }.as<std::string>(); }));
            expect(throws<error>([] { value { "1" }.as_number(); }));
            test_same(2.0, value { 2 }.as_number());
        };
        "numbers compare by value"_test = [] {
            expect(value { 1 } == value { 1.0 });
            expect(value { 1.0 } == value { 1 });
            expect(!(value { 1 } == value { 1.5 }));
            expect(!(value { 1 } == value { "1" }));
            expect(!(value { 1 } == value { true }));
        };
        "same value zero"_test = [] {
            const auto nan = std::numeric_limits<double>::quiet_NaN();
            expect(value { nan } == value { nan });
            expect(value { -0.0 } == value { 0.0 });
            expect(value { -0.0 } == value { 0 });
        };
        "scalars compare by value"_test = [] {
            expect(value { "abc" } == value { std::string { "abc" } });
            expect(value { undefined } == value { undefined });
            expect(!(value { undefined } == value { nullptr }));
            expect(value { cpp_int { "123456789012345678901234567890" } } == value { cpp_int { "123456789012345678901234567890" } });
            expect(value { date_from_iso("2023-03-20T09:15:38.137Z") } == value { date_from_iso("2023-03-20T11:15:38.137+02:00") });
        };
        "containers compare by identity"_test = [] {
            expect(value { array_ref { 1 } } == value { array_ref { 1 } });
            expect(!(value { array_ref { 1 } } == value { array_ref { 2 } }));
            expect(!(value { array_ref { 1 } } == value { object_ref { 1 } }));
        };
        "custom values compare by identity"_test = [] {
            const auto c = make_custom("Point", 42);
            expect(value { custom { c } } == value { custom { c } });
            expect(!(value { make_custom("Point", 42) } == value { make_custom("Point", 42) }));
            test_same(42, c.as<int>());
            expect(throws<error>([&] { c.as<double>(); }));
        };
        "equal values hash equally"_test = [] {
            const value_hash h {};
            expect(h(value { 1 }) == h(value { 1.0 }));
            expect(h(value { 0 }) == h(value { -0.0 }));
            const auto nan = std::numeric_limits<double>::quiet_NaN();
            expect(h(value { nan }) == h(value { -nan }));
            expect(h(value { "x" }) == h(value { "x" }));
            expect(h(value { set_ref { 5 } }) == h(value { set_ref { 5 } }));
        };
        "integers beyond 2^53 compare exactly"_test = [] {
            const value big { int64_t { 9007199254740993 } };
            const value rounded { 9007199254740992.0 };
            expect(!(big == rounded));
            expect(!(rounded == big));
            expect(value { int64_t { 9007199254740992 } } == rounded);
            expect(value_hash {}(value { int64_t { 9007199254740992 } }) == value_hash {}(rounded));
            expect(!(value { std::numeric_limits<int64_t>::max() } == value { 9223372036854775808.0 }));
            expect(!(value { 1 } == value { std::numeric_limits<double>::infinity() }));
            document doc {};
            auto &s = doc.set(doc.new_set());
            expect(s.add(rounded));
            expect(s.add(big));
            expect(!s.add(value { int64_t { 9007199254740992 } }));
            expect(s.contains(value { int64_t { 9007199254740992 } }));
            expect(s.size() == 2_u);
        };
        "hashable"_test = [] {
            expect(value { 1 }.hashable());
            expect(value { "a" }.hashable());
            expect(value { date_from_iso("2023-03-20") }.hashable());
            expect(!value { array_ref { 0 } }.hashable());
            expect(!value { make_custom("Point", 1) }.hashable());
        };
    };
    "devalue::document"_test = [] {
        "node allocation"_test = [] {
            document doc {};
            const auto arr = doc.new_array(2);
            const auto obj = doc.new_object();
            const auto s = doc.new_set();
            const auto m = doc.new_map();
            expect(doc.num_nodes() == 4_u);
            expect(arr.id == 0_u);
            expect(m.id == 3_u);
            doc.array(arr)[0] = obj;
            doc.array(arr)[1] = s;
            doc.object(obj).set("arr", arr);
            doc.set(s).add(1);
            doc.map(m).set("k", "v");
            doc.root(arr);
            const auto &root = doc.array(doc.root());
            expect(doc.object(root.at(0)).at("arr") == value { arr });
            expect(doc.set(root.at(1)).contains(value { 1 }));
            expect(doc.map(value { m }).at(value { "k" }) == value { "v" });
        };
        "kind mismatches"_test = [] {
            document doc {};
            const auto arr = doc.new_array();
            expect(throws<error>([&] { doc.object(object_ref { arr.id }); }));
            expect(throws<error>([&] { doc.array(array_ref { 7 }); }));
            expect(throws<error>([&] { doc.array(value { 1 }); }));
        };
        "object keys keep the insertion order"_test = [] {
            document doc {};
            const auto obj = doc.new_object();
            auto &o = doc.object(obj);
            o.set("b", 1);
            o.set("a", 2);
            o.set("b", 3);
            expect(o.size() == 2_u);
            test_same(std::string { "b" }, o.begin()->first);
            expect(o.at("b") == value { 3 });
            expect(o.find("c") == nullptr);
            expect(throws<error>([&] { o.at("c"); }));
        };
        "set deduplication"_test = [] {
            document doc {};
            auto &s = doc.set(doc.new_set());
            expect(s.add(1));
            expect(!s.add(1.0));
            expect(s.add("1"));
            expect(s.add(std::numeric_limits<double>::quiet_NaN()));
            expect(!s.add(std::numeric_limits<double>::quiet_NaN()));
            expect(s.size() == 3_u);
        };
        "node references survive growth"_test = [] {
            document doc {};
            auto &first = doc.array(doc.new_array(1));
            for (size_t i = 0; i < 10'000; ++i)
                doc.new_object();
            first[0] = 5;
            expect(doc.array(array_ref { 0 }).at(0) == value { 5 });
        };
    };
};
